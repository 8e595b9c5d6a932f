#pragma once

#include "audio/OutputDevice.hpp"
#include "model/Track.hpp"
#include <atomic>
#include <functional>
#include <vector>

namespace rondo::playback {

class TrackHandle;

using ProgressCallback = std::function<void(const model::TrackInfo&, long current_frame)>;

// Render source bound to one TrackHandle. Pulls decoded frames, applies the
// volume, reports progress every Nth period and detects end of stream by the
// decoder position no longer advancing.
class StreamCallback : public audio::RenderSource {
public:
    static constexpr int kDefaultProgressEvery = 2;

    StreamCallback(TrackHandle& track,
                   const std::atomic<float>& volume,
                   std::atomic<bool>& suppress_auto_advance,
                   ProgressCallback on_progress,
                   int progress_every = kDefaultProgressEvery);

    audio::RenderResult render(float* out, std::size_t frames, int channels) override;

private:
    void write_frames(float* out, std::size_t frames, int out_channels, float volume) const;

    TrackHandle& track_;
    const std::atomic<float>& volume_;
    std::atomic<bool>& suppress_auto_advance_;
    ProgressCallback on_progress_;
    int progress_every_;

    std::vector<float> scratch_;
    int cycle_ = 0;
};

}  // namespace rondo::playback
