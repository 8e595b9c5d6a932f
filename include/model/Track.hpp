#pragma once

#include <optional>
#include <string>

namespace rondo::model {

enum class PlaybackState {
    Unloaded,
    Stopped,
    Playing,
    Paused,
};

inline const char* to_string(PlaybackState state) {
    switch (state) {
        case PlaybackState::Unloaded: return "Unloaded";
        case PlaybackState::Stopped: return "Stopped";
        case PlaybackState::Playing: return "Playing";
        case PlaybackState::Paused: return "Paused";
    }
    return "Unknown";
}

// Values embedded in the file by its tagging scheme. Either may be absent.
struct TrackTags {
    std::string title;
    std::optional<double> duration_seconds;
};

// Immutable description of a loaded track, handed to progress observers.
struct TrackInfo {
    std::string location;
    std::string title;
    double duration_seconds = 0.0;  // One decimal place
    long total_frames = 0;
    int sample_rate = 0;
    int channels = 0;

    bool operator==(const TrackInfo&) const = default;
};

}  // namespace rondo::model
