#include "playback/PlaybackController.hpp"
#include "playback/Errors.hpp"
#include "util/Logger.hpp"
#include <algorithm>
#include <cmath>

namespace rondo::playback {

using model::PlaybackState;

// Outlives the controller inside queued notifications. Cleared on destruction
// once no handler is running.
struct PlaybackController::FinishedGate {
    std::mutex mutex;
    PlaybackController* controller = nullptr;
};

PlaybackController::PlaybackController(backend::TrackCatalog& catalog,
                                       audio::DecoderFactory& decoders,
                                       audio::OutputDevice& device,
                                       ProgressCallback on_progress,
                                       ControllerOptions options)
    : catalog_(catalog),
      on_progress_(std::move(on_progress)),
      progress_every_(std::max(options.progress_every, 1)),
      seek_step_(options.seek_step),
      volume_(std::clamp(options.initial_volume, 0.0f, 1.0f)),
      gate_(std::make_shared<FinishedGate>()),
      machine_(decoders, device,
               [this](TrackHandle& track) {
                   return std::make_unique<StreamCallback>(track, volume_, suppress_auto_advance_,
                                                           on_progress_, progress_every_);
               },
               [gate = gate_](audio::FinishReason reason, const std::string& detail) {
                   std::lock_guard<std::mutex> lock(gate->mutex);
                   if (gate->controller) {
                       gate->controller->on_stream_finished(reason, detail);
                   }
               }) {
    gate_->controller = this;
}

PlaybackController::~PlaybackController() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        shutting_down_ = true;
    }
    machine_.shutdown();
    std::lock_guard<std::mutex> lock(gate_->mutex);
    gate_->controller = nullptr;
}

void PlaybackController::set_error_callback(ErrorCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    on_error_ = std::move(callback);
}

void PlaybackController::report_error(const std::string& message) {
    util::Logger::error("PlaybackController: " + message);
    if (on_error_) {
        on_error_(message);
    }
}

void PlaybackController::load_locked(std::size_t index) {
    std::string location = catalog_.resolve(index);
    machine_.load(location);
    current_index_ = index;
}

void PlaybackController::start_locked() {
    suppress_auto_advance_.store(false, std::memory_order_release);
    machine_.start();
}

std::optional<std::size_t> PlaybackController::loaded_index_locked() const {
    const TrackHandle* track = machine_.track();
    if (!track) return std::nullopt;
    return catalog_.index_of(track->location());
}

bool PlaybackController::advance_locked() {
    const std::size_t length = catalog_.current_length();

    // The catalog may have been refreshed or replaced since the track loaded
    auto loaded = loaded_index_locked();
    if (loaded != current_index_) {
        current_index_ = loaded;
        cursor_.invalidate();
    }

    for (std::size_t attempt = 0; attempt < length; ++attempt) {
        auto next = cursor_.next(length, current_index_);
        if (!next) break;

        try {
            load_locked(*next);
            start_locked();
            util::Logger::info("PlaybackController: Advanced to track " + std::to_string(*next));
            return true;
        } catch (const DecodeError& e) {
            report_error(e.what());
        } catch (const backend::CatalogIndexError& e) {
            report_error(e.what());
        }
    }

    util::Logger::warn("PlaybackController: No playable track to advance to");
    return false;
}

void PlaybackController::load(std::size_t index) {
    std::lock_guard<std::mutex> lock(mutex_);
    load_locked(index);
    cursor_.invalidate();
}

void PlaybackController::play(std::size_t index) {
    std::lock_guard<std::mutex> lock(mutex_);
    load_locked(index);
    cursor_.invalidate();
    start_locked();
}

void PlaybackController::toggle_play_pause(std::size_t selected) {
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        if (machine_.state() == PlaybackState::Paused) {
            suppress_auto_advance_.store(false, std::memory_order_release);
        }
        machine_.pause_or_resume();
    } catch (const StreamNotActive&) {
        start_locked();
    } catch (const NoTrackLoaded&) {
        load_locked(selected);
        cursor_.invalidate();
        start_locked();
    }
}

bool PlaybackController::stop(bool auto_advance) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!auto_advance) {
        suppress_auto_advance_.store(true, std::memory_order_release);
    }

    try {
        machine_.stop();
    } catch (const NoTrackLoaded&) {
        return false;
    } catch (const StreamNotActive&) {
        return false;
    }

    if (auto_advance) {
        advance_locked();
    }
    return true;
}

bool PlaybackController::skip_next() {
    std::lock_guard<std::mutex> lock(mutex_);
    suppress_auto_advance_.store(true, std::memory_order_release);

    try {
        machine_.stop();
    } catch (const NoTrackLoaded&) {
    } catch (const StreamNotActive&) {
    }

    return advance_locked();
}

void PlaybackController::set_volume(float value) {
    volume_.store(std::clamp(value, 0.0f, 1.0f), std::memory_order_relaxed);
}

void PlaybackController::seek_relative(double delta_fraction) {
    std::lock_guard<std::mutex> lock(mutex_);
    const TrackHandle* track = machine_.track();
    if (!track) {
        throw NoTrackLoaded();
    }

    long total = track->total_frames();
    long target = track->tell() + std::lround(delta_fraction * static_cast<double>(total));
    machine_.seek(std::clamp(target, 0L, std::max(total, 0L)));
}

void PlaybackController::on_stream_finished(audio::FinishReason reason, const std::string& detail) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shutting_down_) return;

    try {
        if (!machine_.reconcile_finished()) {
            return;
        }
        if (reason == audio::FinishReason::Failed) {
            report_error(DeviceError(detail).what());
            return;
        }
        if (suppress_auto_advance_.load(std::memory_order_acquire)) {
            util::Logger::debug("PlaybackController: Track ended, auto-advance suppressed");
            return;
        }
        advance_locked();
    } catch (const PlaybackError& e) {
        report_error(e.what());
    }
}

model::PlaybackState PlaybackController::current_state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return machine_.state();
}

std::string PlaybackController::current_track_title() const {
    std::lock_guard<std::mutex> lock(mutex_);
    const TrackHandle* track = machine_.track();
    return track ? track->title() : std::string();
}

long PlaybackController::current_frame_position() const {
    std::lock_guard<std::mutex> lock(mutex_);
    const TrackHandle* track = machine_.track();
    return track ? track->tell() : 0;
}

long PlaybackController::total_frames() const {
    std::lock_guard<std::mutex> lock(mutex_);
    const TrackHandle* track = machine_.track();
    return track ? track->total_frames() : 0;
}

double PlaybackController::duration_seconds() const {
    std::lock_guard<std::mutex> lock(mutex_);
    const TrackHandle* track = machine_.track();
    return track ? track->duration_seconds() : 0.0;
}

std::optional<std::size_t> PlaybackController::current_index() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_index_;
}

}  // namespace rondo::playback
