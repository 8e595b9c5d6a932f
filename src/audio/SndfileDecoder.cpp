#include "audio/SndfileDecoder.hpp"
#include "util/Logger.hpp"
#include <cstring>

namespace rondo::audio {

SndfileDecoder::SndfileDecoder() {
    std::memset(&info_, 0, sizeof(info_));
}

SndfileDecoder::~SndfileDecoder() {
    close();
}

bool SndfileDecoder::open(const std::string& filepath) {
    util::Logger::debug("SndfileDecoder: Opening file: " + filepath);

    std::memset(&info_, 0, sizeof(info_));
    file_ = sf_open(filepath.c_str(), SFM_READ, &info_);
    if (!file_) {
        error_ = sf_strerror(nullptr);
        util::Logger::error("SndfileDecoder: Failed to open file: " + filepath + " (" + error_ + ")");
        return false;
    }

    sample_rate_ = info_.samplerate;
    channels_ = info_.channels;
    total_frames_ = static_cast<long>(info_.frames);
    position_frames_ = 0;

    util::Logger::info("SndfileDecoder: Opened " + filepath + " - " +
                       std::to_string(sample_rate_) + "Hz, " +
                       std::to_string(channels_) + "ch, " +
                       std::to_string(total_frames_) + " frames");

    return true;
}

void SndfileDecoder::close() {
    if (file_) {
        util::Logger::debug("SndfileDecoder: Closing decoder");
        sf_close(file_);
        file_ = nullptr;
    }
    sample_rate_ = 0;
    channels_ = 0;
    total_frames_ = 0;
    position_frames_ = 0;
}

int SndfileDecoder::read_pcm(float* buffer, int max_frames) {
    if (!file_ || !buffer || max_frames <= 0) return 0;

    sf_count_t frames_read = sf_readf_float(file_, buffer, max_frames);
    if (frames_read < 0) return 0;

    position_frames_ += static_cast<long>(frames_read);
    return static_cast<int>(frames_read);
}

bool SndfileDecoder::seek(long frame) {
    util::Logger::debug("SndfileDecoder: Seeking to frame " + std::to_string(frame));

    if (!file_) return false;

    sf_count_t result = sf_seek(file_, static_cast<sf_count_t>(frame), SEEK_SET);
    if (result < 0) {
        error_ = sf_strerror(file_);
        util::Logger::error("SndfileDecoder: Seek failed to frame " + std::to_string(frame));
        return false;
    }

    position_frames_ = static_cast<long>(result);
    return true;
}

model::TrackTags SndfileDecoder::get_tags() const {
    model::TrackTags tags;
    if (!file_) return tags;

    // libsndfile exposes no duration tag; the caller derives it from frames
    const char* title = sf_get_string(file_, SF_STR_TITLE);
    if (title) tags.title = title;
    return tags;
}

} // namespace rondo::audio
