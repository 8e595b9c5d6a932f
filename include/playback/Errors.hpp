#pragma once

#include <stdexcept>
#include <string>

namespace rondo::playback {

// Base of every error raised by the playback engine.
class PlaybackError : public std::runtime_error {
public:
    explicit PlaybackError(const std::string& msg) : std::runtime_error(msg) {}
};

// Control-flow errors. The controller recovers from these locally.

class NoTrackLoaded : public PlaybackError {
public:
    NoTrackLoaded() : PlaybackError("No audio file is loaded") {}
};

class StreamNotActive : public PlaybackError {
public:
    StreamNotActive() : PlaybackError("Stream is not active") {}
};

class StreamAlreadyRunning : public PlaybackError {
public:
    StreamAlreadyRunning() : PlaybackError("Stream already running") {}
};

class StreamIsPaused : public PlaybackError {
public:
    StreamIsPaused() : PlaybackError("Stream is paused, stop stream first") {}
};

// Surfaced to the user.

class DecodeError : public PlaybackError {
public:
    DecodeError(const std::string& resource, const std::string& cause)
        : PlaybackError("Cannot decode " + resource + ": " + cause),
          resource_(resource), cause_(cause) {}

    const std::string& resource() const { return resource_; }
    const std::string& cause() const { return cause_; }

private:
    std::string resource_;
    std::string cause_;
};

class DeviceError : public PlaybackError {
public:
    explicit DeviceError(const std::string& cause)
        : PlaybackError("Audio device error: " + cause), cause_(cause) {}

    const std::string& cause() const { return cause_; }

private:
    std::string cause_;
};

}  // namespace rondo::playback
