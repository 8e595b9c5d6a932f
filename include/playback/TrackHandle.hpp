#pragma once

#include "audio/AudioDecoder.hpp"
#include "audio/DecoderFactory.hpp"
#include "model/Track.hpp"
#include <atomic>
#include <memory>
#include <string>

namespace rondo::playback {

// Exclusive decoder session for one track plus the metadata derived from it.
// Reads happen on the device thread while Playing; everything else on the
// command thread while the stream is quiesced.
class TrackHandle {
public:
    // Throws DecodeError when no decoder accepts the resource or it fails to open
    static std::unique_ptr<TrackHandle> open(const std::string& location,
                                             audio::DecoderFactory& factory);

    ~TrackHandle();

    TrackHandle(const TrackHandle&) = delete;
    TrackHandle& operator=(const TrackHandle&) = delete;

    const model::TrackInfo& info() const { return info_; }
    const std::string& location() const { return info_.location; }
    const std::string& title() const { return info_.title; }
    double duration_seconds() const { return info_.duration_seconds; }
    long total_frames() const { return info_.total_frames; }
    int sample_rate() const { return info_.sample_rate; }
    int channels() const { return info_.channels; }

    // Interleaved frames at channels(). Returns the number of frames read,
    // short only at end of data.
    int read(float* buffer, int frames);

    // Clamped to [0, total_frames]. Throws DecodeError if the decoder refuses.
    void seek(long frame);

    long tell() const { return position_.load(std::memory_order_acquire); }

    void close();
    bool is_open() const { return decoder_ != nullptr; }

    // Nearest tenth, ties to even
    static double round_duration(double seconds);

private:
    TrackHandle(std::unique_ptr<audio::AudioDecoder> decoder, model::TrackInfo info);

    std::unique_ptr<audio::AudioDecoder> decoder_;
    model::TrackInfo info_;
    std::atomic<long> position_{0};
};

}  // namespace rondo::playback
