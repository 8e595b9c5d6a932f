#include "audio/M4ADecoder.hpp"
#include "util/Logger.hpp"
#include <algorithm>
#include <cstring>

extern "C" {
#include <libavformat/avformat.h>
#include <libavcodec/avcodec.h>
#include <libavutil/opt.h>
#include <libavutil/channel_layout.h>
#include <libswresample/swresample.h>
}

namespace rondo::audio {

namespace {

std::string av_error_string(int code) {
    char errbuf[256];
    av_strerror(code, errbuf, sizeof(errbuf));
    return errbuf;
}

}  // namespace

M4ADecoder::M4ADecoder() = default;

M4ADecoder::~M4ADecoder() {
    close();
}

bool M4ADecoder::fail(const std::string& message) {
    error_ = message;
    util::Logger::error("M4ADecoder: " + message);
    close();
    return false;
}

bool M4ADecoder::open(const std::string& filepath) {
    util::Logger::debug("M4ADecoder: Opening file: " + filepath);

    int ret = avformat_open_input(&format_ctx_, filepath.c_str(), nullptr, nullptr);
    if (ret < 0) {
        format_ctx_ = nullptr;
        return fail("Failed to open " + filepath + " (" + av_error_string(ret) + ")");
    }

    ret = avformat_find_stream_info(format_ctx_, nullptr);
    if (ret < 0) {
        return fail("Failed to find stream info (" + av_error_string(ret) + ")");
    }

    audio_stream_index_ = av_find_best_stream(format_ctx_, AVMEDIA_TYPE_AUDIO, -1, -1, nullptr, 0);
    if (audio_stream_index_ < 0) {
        return fail("No audio stream found");
    }

    AVStream* audio_stream = format_ctx_->streams[audio_stream_index_];
    AVCodecParameters* codecpar = audio_stream->codecpar;

    const AVCodec* codec = avcodec_find_decoder(codecpar->codec_id);
    if (!codec) {
        return fail("Decoder not found for codec ID " + std::to_string(codecpar->codec_id));
    }

    codec_ctx_ = avcodec_alloc_context3(codec);
    if (!codec_ctx_) {
        return fail("Failed to allocate codec context");
    }

    ret = avcodec_parameters_to_context(codec_ctx_, codecpar);
    if (ret < 0) {
        return fail("Failed to copy codec parameters");
    }

    ret = avcodec_open2(codec_ctx_, codec, nullptr);
    if (ret < 0) {
        return fail("Failed to open codec (" + av_error_string(ret) + ")");
    }

    sample_rate_ = codec_ctx_->sample_rate;
    channels_ = codec_ctx_->ch_layout.nb_channels;

    if (audio_stream->duration != AV_NOPTS_VALUE) {
        double duration_sec = audio_stream->duration * av_q2d(audio_stream->time_base);
        total_frames_ = static_cast<long>(duration_sec * sample_rate_);
    } else if (format_ctx_->duration != AV_NOPTS_VALUE) {
        double duration_sec = format_ctx_->duration / static_cast<double>(AV_TIME_BASE);
        total_frames_ = static_cast<long>(duration_sec * sample_rate_);
    } else {
        total_frames_ = 0;
    }

    // Planar or packed input -> packed float at the native rate
    AVChannelLayout out_ch_layout;
    av_channel_layout_default(&out_ch_layout, channels_);
    ret = swr_alloc_set_opts2(&swr_ctx_,
                              &out_ch_layout, AV_SAMPLE_FMT_FLT, sample_rate_,
                              &codec_ctx_->ch_layout, codec_ctx_->sample_fmt, sample_rate_,
                              0, nullptr);
    av_channel_layout_uninit(&out_ch_layout);
    if (ret < 0 || swr_init(swr_ctx_) < 0) {
        return fail("Failed to initialize resampler");
    }

    packet_ = av_packet_alloc();
    frame_ = av_frame_alloc();
    if (!packet_ || !frame_) {
        return fail("Failed to allocate packet/frame");
    }

    position_frames_ = 0;

    util::Logger::info("M4ADecoder: Opened " + filepath + " - " +
                       std::to_string(sample_rate_) + "Hz, " +
                       std::to_string(channels_) + "ch, " +
                       std::to_string(total_frames_) + " frames");

    return true;
}

void M4ADecoder::close() {
    residual_.clear();
    residual_offset_ = 0;

    if (frame_) av_frame_free(&frame_);
    if (packet_) av_packet_free(&packet_);
    if (swr_ctx_) swr_free(&swr_ctx_);
    if (codec_ctx_) avcodec_free_context(&codec_ctx_);
    if (format_ctx_) {
        util::Logger::debug("M4ADecoder: Closing decoder");
        avformat_close_input(&format_ctx_);
    }

    audio_stream_index_ = -1;
    sample_rate_ = 0;
    channels_ = 0;
    total_frames_ = 0;
    position_frames_ = 0;
}

int M4ADecoder::drain_residual(float* buffer, int max_frames) {
    size_t available = (residual_.size() - residual_offset_) / channels_;
    int to_copy = static_cast<int>(std::min<size_t>(available, max_frames));
    std::memcpy(buffer, residual_.data() + residual_offset_, to_copy * channels_ * sizeof(float));
    residual_offset_ += static_cast<size_t>(to_copy) * channels_;
    if (residual_offset_ >= residual_.size()) {
        residual_.clear();
        residual_offset_ = 0;
    }
    return to_copy;
}

int M4ADecoder::read_pcm(float* buffer, int max_frames) {
    if (!format_ctx_ || !codec_ctx_ || !buffer || max_frames <= 0) return 0;

    int frames_written = 0;
    if (!residual_.empty()) {
        frames_written += drain_residual(buffer, max_frames);
    }

    while (frames_written < max_frames) {
        int ret = av_read_frame(format_ctx_, packet_);
        if (ret < 0) break;  // EOF or error

        if (packet_->stream_index != audio_stream_index_) {
            av_packet_unref(packet_);
            continue;
        }

        ret = avcodec_send_packet(codec_ctx_, packet_);
        av_packet_unref(packet_);
        if (ret < 0) continue;

        while (frames_written < max_frames) {
            ret = avcodec_receive_frame(codec_ctx_, frame_);
            if (ret < 0) break;  // EAGAIN, EOF or decode error

            size_t needed = static_cast<size_t>(frame_->nb_samples) * channels_;
            if (convert_buffer_.size() < needed) convert_buffer_.resize(needed);
            uint8_t* out_ptr = reinterpret_cast<uint8_t*>(convert_buffer_.data());

            int converted = swr_convert(swr_ctx_, &out_ptr, frame_->nb_samples,
                                        const_cast<const uint8_t**>(frame_->extended_data),
                                        frame_->nb_samples);
            av_frame_unref(frame_);
            if (converted <= 0) continue;

            int to_copy = std::min(converted, max_frames - frames_written);
            std::memcpy(buffer + frames_written * channels_, convert_buffer_.data(),
                        to_copy * channels_ * sizeof(float));
            frames_written += to_copy;

            if (converted > to_copy) {
                residual_.assign(convert_buffer_.begin() + to_copy * channels_,
                                 convert_buffer_.begin() + converted * channels_);
                residual_offset_ = 0;
            }
        }
    }

    position_frames_ += frames_written;
    return frames_written;
}

bool M4ADecoder::seek(long frame) {
    util::Logger::debug("M4ADecoder: Seeking to frame " + std::to_string(frame));

    if (!format_ctx_ || audio_stream_index_ < 0) return false;

    residual_.clear();
    residual_offset_ = 0;

    AVStream* stream = format_ctx_->streams[audio_stream_index_];
    int64_t timestamp = av_rescale_q(frame, AVRational{1, sample_rate_}, stream->time_base);

    int ret = av_seek_frame(format_ctx_, audio_stream_index_, timestamp, AVSEEK_FLAG_BACKWARD);
    if (ret < 0) {
        error_ = "seek failed (" + av_error_string(ret) + ")";
        util::Logger::error("M4ADecoder: Seek failed");
        return false;
    }

    avcodec_flush_buffers(codec_ctx_);
    position_frames_ = frame;
    return true;
}

model::TrackTags M4ADecoder::get_tags() const {
    model::TrackTags tags;
    if (!format_ctx_) return tags;

    const AVDictionaryEntry* title = av_dict_get(format_ctx_->metadata, "title", nullptr, 0);
    if (title && title->value) tags.title = title->value;

    if (format_ctx_->duration != AV_NOPTS_VALUE) {
        tags.duration_seconds = format_ctx_->duration / static_cast<double>(AV_TIME_BASE);
    }
    return tags;
}

} // namespace rondo::audio
