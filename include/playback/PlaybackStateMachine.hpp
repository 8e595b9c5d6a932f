#pragma once

#include "audio/DecoderFactory.hpp"
#include "audio/OutputDevice.hpp"
#include "model/Track.hpp"
#include "playback/TrackHandle.hpp"
#include <functional>
#include <memory>
#include <string>

namespace rondo::playback {

using SourceFactory = std::function<std::unique_ptr<audio::RenderSource>(TrackHandle&)>;

// Four-state stream controller. Every operation either performs the
// transition below or throws the named error with the state unchanged.
// DecodeError and DeviceError may leave the machine in Stopped.
//
//            load        start                 stop              pause_or_resume
// Unloaded   -> Stopped  NoTrackLoaded         NoTrackLoaded     NoTrackLoaded
// Stopped    -> Stopped  -> Playing            StreamNotActive   StreamNotActive
// Playing    -> Stopped  StreamAlreadyRunning  -> Stopped        -> Paused
// Paused     -> Stopped  StreamIsPaused        -> Stopped        -> Playing
//
// Not thread-safe; the owner serializes calls.
class PlaybackStateMachine {
public:
    PlaybackStateMachine(audio::DecoderFactory& decoders,
                         audio::OutputDevice& device,
                         SourceFactory make_source,
                         audio::FinishedCallback on_finished);
    ~PlaybackStateMachine();

    PlaybackStateMachine(const PlaybackStateMachine&) = delete;
    PlaybackStateMachine& operator=(const PlaybackStateMachine&) = delete;

    // Tears down any active stream first. On failure the previous track, if
    // any, stays loaded in Stopped.
    void load(const std::string& location);
    void start();
    void stop();
    void pause_or_resume();

    // Playing: deactivate, seek, reactivate. Otherwise seeks in place.
    void seek(long frame);

    // Called after the device reports a stream finished. Returns true when
    // the stream ended on its own while Playing; the machine is then moved to
    // Stopped at frame 0.
    bool reconcile_finished();

    // Deactivates and releases the stream and track. Back to Unloaded.
    void shutdown();

    model::PlaybackState state() const { return state_; }
    const TrackHandle* track() const { return track_.get(); }
    bool stream_active() const;

private:
    void stop_stream();
    void activate_stream();

    audio::DecoderFactory& decoders_;
    audio::OutputDevice& device_;
    SourceFactory make_source_;
    audio::FinishedCallback on_finished_;

    model::PlaybackState state_ = model::PlaybackState::Unloaded;
    // The stream's render source reads the track; destroy the stream first
    std::unique_ptr<TrackHandle> track_;
    std::unique_ptr<audio::OutputStream> stream_;
};

}  // namespace rondo::playback
