#include "playback/TrackHandle.hpp"
#include "playback/Errors.hpp"
#include "util/Logger.hpp"
#include <algorithm>
#include <charconv>
#include <system_error>
#include <filesystem>
#include <format>

namespace rondo::playback {

namespace {

std::string title_from_location(const std::string& location) {
    std::filesystem::path p(location);
    std::string stem = p.stem().string();
    return stem.empty() ? p.filename().string() : stem;
}

}  // namespace

double TrackHandle::round_duration(double seconds) {
    // Rounds the exact binary value; exact halves go to even.
    // std::format and std::from_chars ignore the global locale.
    std::string text = std::format("{:.1f}", seconds);
    double rounded = 0.0;
    auto result = std::from_chars(text.data(), text.data() + text.size(), rounded);
    if (result.ec != std::errc()) {
        return seconds;
    }
    return rounded;
}

std::unique_ptr<TrackHandle> TrackHandle::open(const std::string& location,
                                               audio::DecoderFactory& factory) {
    auto decoder = factory.create(location);
    if (!decoder) {
        throw DecodeError(location, "unsupported format");
    }
    if (!decoder->open(location)) {
        std::string cause = decoder->get_error().empty() ? "open failed" : decoder->get_error();
        throw DecodeError(location, cause);
    }

    model::TrackInfo info;
    info.location = location;
    info.sample_rate = decoder->get_sample_rate();
    info.channels = decoder->get_channels();
    info.total_frames = decoder->get_total_frames();

    if (info.channels <= 0) {
        decoder->close();
        throw DecodeError(location, "no audio channels");
    }

    double fallback = info.sample_rate > 0
        ? static_cast<double>(info.total_frames) / info.sample_rate
        : 0.0;

    model::TrackTags tags;
    try {
        tags = decoder->get_tags();
    } catch (const std::exception& e) {
        util::Logger::warn("TrackHandle: Unreadable tags in " + location + ": " + e.what());
    }

    info.title = tags.title.empty() ? title_from_location(location) : tags.title;
    info.duration_seconds = round_duration(tags.duration_seconds.value_or(fallback));

    util::Logger::debug(std::format("TrackHandle: Opened {} ({} Hz, {} ch, {} frames, {:.1f}s)",
                                    location, info.sample_rate, info.channels,
                                    info.total_frames, info.duration_seconds));

    return std::unique_ptr<TrackHandle>(new TrackHandle(std::move(decoder), std::move(info)));
}

TrackHandle::TrackHandle(std::unique_ptr<audio::AudioDecoder> decoder, model::TrackInfo info)
    : decoder_(std::move(decoder)), info_(std::move(info)) {
    position_.store(decoder_->get_position_frames(), std::memory_order_release);
}

TrackHandle::~TrackHandle() {
    close();
}

int TrackHandle::read(float* buffer, int frames) {
    if (!decoder_) {
        throw DecodeError(info_.location, "session closed");
    }
    int got = decoder_->read_pcm(buffer, frames);
    position_.store(decoder_->get_position_frames(), std::memory_order_release);
    return std::max(got, 0);
}

void TrackHandle::seek(long frame) {
    if (!decoder_) {
        throw DecodeError(info_.location, "session closed");
    }
    frame = std::clamp(frame, 0L, std::max(info_.total_frames, 0L));
    if (!decoder_->seek(frame)) {
        std::string cause = decoder_->get_error().empty() ? "seek failed" : decoder_->get_error();
        throw DecodeError(info_.location, cause);
    }
    position_.store(decoder_->get_position_frames(), std::memory_order_release);
}

void TrackHandle::close() {
    if (decoder_) {
        decoder_->close();
        decoder_.reset();
        util::Logger::debug("TrackHandle: Closed " + info_.location);
    }
}

}  // namespace rondo::playback
