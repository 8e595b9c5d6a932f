#include "playback/PlaybackStateMachine.hpp"
#include "playback/Errors.hpp"
#include "util/Logger.hpp"

namespace rondo::playback {

using model::PlaybackState;

PlaybackStateMachine::PlaybackStateMachine(audio::DecoderFactory& decoders,
                                           audio::OutputDevice& device,
                                           SourceFactory make_source,
                                           audio::FinishedCallback on_finished)
    : decoders_(decoders),
      device_(device),
      make_source_(std::move(make_source)),
      on_finished_(std::move(on_finished)) {
}

PlaybackStateMachine::~PlaybackStateMachine() {
    shutdown();
}

bool PlaybackStateMachine::stream_active() const {
    return stream_ && stream_->is_active();
}

void PlaybackStateMachine::stop_stream() {
    // Blocks until the render source is idle
    stream_->deactivate();
    state_ = PlaybackState::Stopped;
    track_->seek(0);
}

void PlaybackStateMachine::activate_stream() {
    try {
        stream_->activate();
    } catch (const DeviceError& e) {
        util::Logger::error("PlaybackStateMachine: " + std::string(e.what()));
        stream_->deactivate();
        state_ = PlaybackState::Stopped;
        track_->seek(0);
        throw;
    }
}

void PlaybackStateMachine::load(const std::string& location) {
    switch (state_) {
        case PlaybackState::Playing:
        case PlaybackState::Paused:
            stop_stream();
            break;
        case PlaybackState::Unloaded:
        case PlaybackState::Stopped:
            break;
    }

    auto track = TrackHandle::open(location, decoders_);
    auto stream = device_.open_stream(track->sample_rate(), track->channels(),
                                      make_source_(*track), on_finished_);

    // Old stream goes before the old track it reads from
    stream_ = std::move(stream);
    track_ = std::move(track);
    state_ = PlaybackState::Stopped;

    util::Logger::info("PlaybackStateMachine: Loaded " + track_->title());
}

void PlaybackStateMachine::start() {
    switch (state_) {
        case PlaybackState::Unloaded:
            throw NoTrackLoaded();
        case PlaybackState::Playing:
            throw StreamAlreadyRunning();
        case PlaybackState::Paused:
            throw StreamIsPaused();
        case PlaybackState::Stopped:
            activate_stream();
            state_ = PlaybackState::Playing;
            util::Logger::debug("PlaybackStateMachine: Playing");
            return;
    }
}

void PlaybackStateMachine::stop() {
    switch (state_) {
        case PlaybackState::Unloaded:
            throw NoTrackLoaded();
        case PlaybackState::Stopped:
            throw StreamNotActive();
        case PlaybackState::Playing:
        case PlaybackState::Paused:
            stop_stream();
            util::Logger::debug("PlaybackStateMachine: Stopped");
            return;
    }
}

void PlaybackStateMachine::pause_or_resume() {
    switch (state_) {
        case PlaybackState::Unloaded:
            throw NoTrackLoaded();
        case PlaybackState::Stopped:
            // Make sure a stream that ended on its own is really down
            stream_->deactivate();
            throw StreamNotActive();
        case PlaybackState::Playing:
            stream_->deactivate();
            state_ = PlaybackState::Paused;
            util::Logger::debug("PlaybackStateMachine: Paused at frame " + std::to_string(track_->tell()));
            return;
        case PlaybackState::Paused:
            activate_stream();
            state_ = PlaybackState::Playing;
            util::Logger::debug("PlaybackStateMachine: Resumed");
            return;
    }
}

void PlaybackStateMachine::seek(long frame) {
    switch (state_) {
        case PlaybackState::Unloaded:
            throw NoTrackLoaded();
        case PlaybackState::Playing:
            stream_->deactivate();
            try {
                track_->seek(frame);
            } catch (const DecodeError&) {
                state_ = PlaybackState::Stopped;
                throw;
            }
            activate_stream();
            return;
        case PlaybackState::Stopped:
        case PlaybackState::Paused:
            track_->seek(frame);
            return;
    }
}

bool PlaybackStateMachine::reconcile_finished() {
    if (state_ != PlaybackState::Playing || stream_active()) {
        // Raised by our own deactivate, or stale
        return false;
    }

    util::Logger::debug("PlaybackStateMachine: Stream finished while playing");
    state_ = PlaybackState::Stopped;
    track_->seek(0);
    return true;
}

void PlaybackStateMachine::shutdown() {
    if (stream_) {
        stream_->deactivate();
    }
    stream_.reset();
    track_.reset();
    state_ = PlaybackState::Unloaded;
}

}  // namespace rondo::playback
