#include "audio/OGGDecoder.hpp"
#include "util/Logger.hpp"
#include <cstring>
#include <cstdio>

namespace rondo::audio {

OGGDecoder::OGGDecoder() {
    std::memset(&vf_, 0, sizeof(vf_));
}

OGGDecoder::~OGGDecoder() {
    close();
}

bool OGGDecoder::open(const std::string& filepath) {
    util::Logger::debug("OGGDecoder: Opening file: " + filepath);

    int result = ov_fopen(filepath.c_str(), &vf_);
    if (result < 0) {
        error_ = "not a readable Ogg Vorbis stream (code " + std::to_string(result) + ")";
        util::Logger::error("OGGDecoder: Failed to open " + filepath + ": " + error_);
        return false;
    }

    vorbis_info* info = ov_info(&vf_, -1);
    if (!info) {
        error_ = "missing vorbis info header";
        util::Logger::error("OGGDecoder: Failed to get vorbis info for: " + filepath);
        ov_clear(&vf_);
        return false;
    }

    sample_rate_ = static_cast<int>(info->rate);
    channels_ = info->channels;
    total_frames_ = static_cast<long>(ov_pcm_total(&vf_, -1));
    position_frames_ = 0;
    is_open_ = true;

    util::Logger::info("OGGDecoder: Opened " + filepath + " - " +
                       std::to_string(sample_rate_) + "Hz, " +
                       std::to_string(channels_) + "ch, " +
                       std::to_string(total_frames_) + " frames");

    return true;
}

void OGGDecoder::close() {
    if (is_open_) {
        util::Logger::debug("OGGDecoder: Closing decoder");
        ov_clear(&vf_);
        is_open_ = false;
    }
    sample_rate_ = 0;
    channels_ = 0;
    total_frames_ = 0;
    position_frames_ = 0;
}

int OGGDecoder::read_pcm(float* buffer, int max_frames) {
    if (!is_open_ || !buffer) return 0;

    float** pcm;
    int frames_read = 0;
    int bitstream = 0;

    while (frames_read < max_frames) {
        long ret = ov_read_float(&vf_, &pcm, max_frames - frames_read, &bitstream);
        if (ret == OV_HOLE) continue;  // Recoverable gap in the page sequence
        if (ret <= 0) break;

        // Interleave channels
        for (long i = 0; i < ret; i++) {
            for (int ch = 0; ch < channels_; ch++) {
                buffer[(frames_read + i) * channels_ + ch] = pcm[ch][i];
            }
        }

        frames_read += static_cast<int>(ret);
    }

    position_frames_ += frames_read;
    return frames_read;
}

bool OGGDecoder::seek(long frame) {
    util::Logger::debug("OGGDecoder: Seeking to frame " + std::to_string(frame));

    if (!is_open_) return false;

    int result = ov_pcm_seek(&vf_, static_cast<ogg_int64_t>(frame));
    if (result != 0) {
        error_ = "seek failed (code " + std::to_string(result) + ")";
        util::Logger::error("OGGDecoder: Seek failed (code=" + std::to_string(result) + ")");
        return false;
    }

    position_frames_ = frame;
    return true;
}

model::TrackTags OGGDecoder::get_tags() const {
    model::TrackTags tags;
    if (!is_open_) return tags;

    vorbis_comment* comment = ov_comment(&vf_, -1);
    if (comment) {
        const char* title = vorbis_comment_query(comment, "TITLE", 0);
        if (title) tags.title = title;
    }

    double total = ov_time_total(&vf_, -1);
    if (total >= 0.0) {
        tags.duration_seconds = total;
    }
    return tags;
}

} // namespace rondo::audio
