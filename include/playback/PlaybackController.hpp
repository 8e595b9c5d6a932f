#pragma once

#include "audio/DecoderFactory.hpp"
#include "audio/OutputDevice.hpp"
#include "backend/TrackCatalog.hpp"
#include "model/Track.hpp"
#include "playback/PlaybackStateMachine.hpp"
#include "playback/PlaylistCursor.hpp"
#include "playback/StreamCallback.hpp"
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace rondo::playback {

using ErrorCallback = std::function<void(const std::string&)>;

struct ControllerOptions {
    float initial_volume = 1.0f;
    int progress_every = StreamCallback::kDefaultProgressEvery;
    double seek_step = 0.05;  // Fraction of the track per seek_forward/backward
};

// Facade held by the application. Commands come from the UI thread; the
// finished handler runs on the device's notification thread. Both are
// serialized on one mutex.
//
// The progress callback runs on the device's real-time thread and the error
// callback under the controller lock: neither may call back into the
// controller.
class PlaybackController {
public:
    PlaybackController(backend::TrackCatalog& catalog,
                       audio::DecoderFactory& decoders,
                       audio::OutputDevice& device,
                       ProgressCallback on_progress,
                       ControllerOptions options = {});
    ~PlaybackController();

    PlaybackController(const PlaybackController&) = delete;
    PlaybackController& operator=(const PlaybackController&) = delete;

    void set_error_callback(ErrorCallback callback);

    // Throws DecodeError, DeviceError or backend::CatalogIndexError
    void load(std::size_t index);
    void play(std::size_t index);

    // Resume, else start, else load `selected` and start.
    void toggle_play_pause(std::size_t selected);

    // Returns false when nothing was playing or paused. With auto_advance the
    // playlist moves straight on to the next entry.
    bool stop(bool auto_advance = false);

    // Stop without auto-advance, then play the playlist's next entry.
    // Returns false when no entry could be started.
    bool skip_next();

    void set_volume(float value);
    float volume() const { return volume_.load(std::memory_order_relaxed); }

    // Moves by delta_fraction of the track, clamped to [0, total_frames].
    void seek_relative(double delta_fraction);
    void seek_forward() { seek_relative(seek_step_); }
    void seek_backward() { seek_relative(-seek_step_); }

    // Device notification: a stream stopped delivering render calls. Only a
    // stream that stopped on its own while playing advances the playlist; a
    // device failure is reported and leaves the machine Stopped.
    void on_stream_finished(audio::FinishReason reason, const std::string& detail = {});

    model::PlaybackState current_state() const;
    std::string current_track_title() const;
    long current_frame_position() const;
    long total_frames() const;
    double duration_seconds() const;
    std::optional<std::size_t> current_index() const;
    bool auto_advance_suppressed() const { return suppress_auto_advance_.load(std::memory_order_acquire); }

private:
    struct FinishedGate;

    void load_locked(std::size_t index);
    void start_locked();
    bool advance_locked();
    std::optional<std::size_t> loaded_index_locked() const;
    void report_error(const std::string& message);

    backend::TrackCatalog& catalog_;
    ProgressCallback on_progress_;
    int progress_every_;
    double seek_step_;

    std::atomic<float> volume_;
    std::atomic<bool> suppress_auto_advance_{false};

    mutable std::mutex mutex_;
    ErrorCallback on_error_;
    std::shared_ptr<FinishedGate> gate_;
    PlaylistCursor cursor_;
    std::optional<std::size_t> current_index_;
    bool shutting_down_ = false;

    PlaybackStateMachine machine_;
};

}  // namespace rondo::playback
