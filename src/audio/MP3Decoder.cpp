#include "audio/MP3Decoder.hpp"
#include "util/Logger.hpp"
#include <cstring>

namespace rondo::audio {

namespace {

// mpg123_init/mpg123_exit must bracket every handle, once per process
struct Mpg123Initializer {
    Mpg123Initializer() { mpg123_init(); }
    ~Mpg123Initializer() { mpg123_exit(); }
};
static Mpg123Initializer g_mpg123_init;

std::string trim(const std::string& str) {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, (last - first + 1));
}

}  // namespace

MP3Decoder::MP3Decoder() {
    handle_ = mpg123_new(nullptr, nullptr);
    if (!handle_) {
        util::Logger::error("MP3Decoder: mpg123_new failed");
    }
}

MP3Decoder::~MP3Decoder() {
    close();
    if (handle_) {
        mpg123_delete(handle_);
        handle_ = nullptr;
    }
}

bool MP3Decoder::open(const std::string& filepath) {
    util::Logger::debug("MP3Decoder: Opening file: " + filepath);

    if (!handle_) {
        error_ = "decoder handle unavailable";
        return false;
    }

    if (mpg123_open(handle_, filepath.c_str()) != MPG123_OK) {
        error_ = mpg123_strerror(handle_);
        util::Logger::error("MP3Decoder: Failed to open file: " + filepath + " (" + error_ + ")");
        return false;
    }

    long rate;
    int channels, encoding;
    if (mpg123_getformat(handle_, &rate, &channels, &encoding) != MPG123_OK) {
        error_ = mpg123_strerror(handle_);
        util::Logger::error("MP3Decoder: Failed to get format for: " + filepath);
        mpg123_close(handle_);
        return false;
    }

    sample_rate_ = static_cast<int>(rate);
    channels_ = channels;

    // Lock output to signed 16-bit so mid-stream format changes cannot alter the layout
    mpg123_format_none(handle_);
    if (mpg123_format(handle_, rate, channels, MPG123_ENC_SIGNED_16) != MPG123_OK) {
        error_ = mpg123_strerror(handle_);
        util::Logger::error("MP3Decoder: Failed to set output format for: " + filepath);
        mpg123_close(handle_);
        return false;
    }

    // Full scan for an exact length; also pulls in the ID3 tags
    mpg123_scan(handle_);
    off_t length = mpg123_length(handle_);
    total_frames_ = (length == MPG123_ERR) ? 0 : static_cast<long>(length);
    position_frames_ = 0;
    opened_ = true;

    util::Logger::info("MP3Decoder: Opened " + filepath + " - " +
                       std::to_string(sample_rate_) + "Hz, " +
                       std::to_string(channels_) + "ch, " +
                       std::to_string(total_frames_) + " frames");

    return true;
}

void MP3Decoder::close() {
    if (handle_ && opened_) {
        util::Logger::debug("MP3Decoder: Closing decoder");
        mpg123_close(handle_);
    }
    opened_ = false;
    sample_rate_ = 0;
    channels_ = 0;
    total_frames_ = 0;
    position_frames_ = 0;
}

int MP3Decoder::read_pcm(float* buffer, int max_frames) {
    if (!opened_ || !buffer || max_frames <= 0 || channels_ <= 0) return 0;

    size_t samples_wanted = static_cast<size_t>(max_frames) * channels_;
    if (s16_buffer_.size() < samples_wanted) {
        s16_buffer_.resize(samples_wanted);
    }

    size_t bytes_read = 0;
    int result = mpg123_read(handle_,
                             reinterpret_cast<unsigned char*>(s16_buffer_.data()),
                             samples_wanted * sizeof(short),
                             &bytes_read);

    if (result == MPG123_NEW_FORMAT) {
        result = mpg123_read(handle_,
                             reinterpret_cast<unsigned char*>(s16_buffer_.data()),
                             samples_wanted * sizeof(short),
                             &bytes_read);
    }

    // Never use partial data from a failed read
    if (result == MPG123_ERR) {
        util::Logger::error(std::string("MP3Decoder: Read error: ") + mpg123_strerror(handle_));
        return 0;
    }

    if (result == MPG123_DONE && bytes_read == 0) {
        return 0;
    }

    int samples_read = static_cast<int>(bytes_read / sizeof(short));
    for (int i = 0; i < samples_read; ++i) {
        buffer[i] = s16_buffer_[i] / 32768.0f;
    }

    int frames_read = samples_read / channels_;
    position_frames_ += frames_read;
    return frames_read;
}

bool MP3Decoder::seek(long frame) {
    util::Logger::debug("MP3Decoder: Seeking to frame " + std::to_string(frame));

    if (!opened_) return false;

    off_t result = mpg123_seek(handle_, static_cast<off_t>(frame), SEEK_SET);
    if (result < 0) {
        error_ = mpg123_strerror(handle_);
        util::Logger::error("MP3Decoder: Seek failed to frame " + std::to_string(frame));
        return false;
    }

    position_frames_ = static_cast<long>(result);
    return true;
}

model::TrackTags MP3Decoder::get_tags() const {
    model::TrackTags tags;
    if (!opened_) return tags;

    mpg123_id3v1* v1 = nullptr;
    mpg123_id3v2* v2 = nullptr;
    if (mpg123_id3(handle_, &v1, &v2) != MPG123_OK) {
        return tags;
    }

    if (v2) {
        if (v2->title && v2->title->p) tags.title = trim(v2->title->p);

        // TLEN carries the length in milliseconds
        for (size_t i = 0; i < v2->texts; ++i) {
            if (std::strncmp(v2->text[i].id, "TLEN", 4) == 0 && v2->text[i].text.p) {
                std::string ms = trim(v2->text[i].text.p);
                if (!ms.empty()) {
                    tags.duration_seconds = std::stod(ms) / 1000.0;
                }
                break;
            }
        }
    } else if (v1) {
        tags.title = trim(std::string(v1->title, strnlen(v1->title, sizeof(v1->title))));
    }

    return tags;
}

} // namespace rondo::audio
