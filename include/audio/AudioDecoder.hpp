#pragma once

#include "model/Track.hpp"
#include <string>
#include <cstddef>

namespace rondo::audio {

class AudioDecoder {
public:
    virtual ~AudioDecoder() = default;

    virtual bool open(const std::string& filepath) = 0;
    virtual void close() = 0;

    // Decodes up to max_frames interleaved float frames. Returns 0 at end of data.
    virtual int read_pcm(float* buffer, int max_frames) = 0;

    virtual int get_sample_rate() const = 0;
    virtual int get_channels() const = 0;
    virtual long get_total_frames() const = 0;
    virtual long get_position_frames() const = 0;

    virtual bool seek(long frame) = 0;
    virtual bool is_open() const = 0;

    // Tags embedded in the opened file. May throw if the tag block is unreadable.
    virtual model::TrackTags get_tags() const = 0;

    // Reason for the last failed open/seek
    const std::string& get_error() const { return error_; }

protected:
    std::string error_;
};

} // namespace rondo::audio
