#include "audio/DecoderFactory.hpp"
#include "audio/SndfileDecoder.hpp"
#include "audio/MP3Decoder.hpp"
#include "audio/OGGDecoder.hpp"
#include "audio/M4ADecoder.hpp"
#include "util/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>

namespace rondo::audio {

AudioFormat FormatDecoderFactory::detect_format(const std::string& path) {
    std::string ext = std::filesystem::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (ext == ".mp3") return AudioFormat::MP3;
    if (ext == ".flac") return AudioFormat::FLAC;
    if (ext == ".ogg" || ext == ".oga") return AudioFormat::OGG;
    if (ext == ".wav") return AudioFormat::WAV;
    if (ext == ".aiff" || ext == ".aif") return AudioFormat::AIFF;
    if (ext == ".m4a" || ext == ".aac") return AudioFormat::M4A;
    return AudioFormat::Unknown;
}

std::string FormatDecoderFactory::format_to_string(AudioFormat format) {
    switch (format) {
        case AudioFormat::MP3: return "MP3";
        case AudioFormat::FLAC: return "FLAC";
        case AudioFormat::OGG: return "OGG/Vorbis";
        case AudioFormat::WAV: return "WAV";
        case AudioFormat::AIFF: return "AIFF";
        case AudioFormat::M4A: return "M4A/AAC";
        default: return "Unknown";
    }
}

std::unique_ptr<AudioDecoder> FormatDecoderFactory::create(const std::string& path) {
    AudioFormat format = detect_format(path);
    util::Logger::debug("FormatDecoderFactory: " + path + " -> " + format_to_string(format));

    switch (format) {
        case AudioFormat::MP3:
            return std::make_unique<MP3Decoder>();

        case AudioFormat::FLAC:
        case AudioFormat::WAV:
        case AudioFormat::AIFF:
            return std::make_unique<SndfileDecoder>();

        case AudioFormat::OGG:
            return std::make_unique<OGGDecoder>();

        case AudioFormat::M4A:
            return std::make_unique<M4ADecoder>();

        default:
            return nullptr;
    }
}

}  // namespace rondo::audio
