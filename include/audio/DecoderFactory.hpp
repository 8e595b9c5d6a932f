#pragma once

#include "audio/AudioDecoder.hpp"
#include <memory>
#include <string>

namespace rondo::audio {

enum class AudioFormat {
    Unknown,
    MP3,
    FLAC,
    OGG,
    WAV,
    AIFF,
    M4A,
};

// Picks an unopened decoder for a resource.
class DecoderFactory {
public:
    virtual ~DecoderFactory() = default;

    // Returns nullptr when no decoder handles the resource.
    virtual std::unique_ptr<AudioDecoder> create(const std::string& path) = 0;
};

// Extension-based selection across the libsndfile, mpg123, vorbisfile and FFmpeg decoders.
class FormatDecoderFactory : public DecoderFactory {
public:
    std::unique_ptr<AudioDecoder> create(const std::string& path) override;

    static AudioFormat detect_format(const std::string& path);
    static std::string format_to_string(AudioFormat format);
};

}  // namespace rondo::audio
