#include "playback/StreamCallback.hpp"
#include "playback/TrackHandle.hpp"
#include "util/Logger.hpp"
#include <algorithm>

namespace rondo::playback {

namespace {
// Covers the usual PipeWire quantum range without growing on the device thread
constexpr std::size_t kInitialScratchFrames = 8192;
}

StreamCallback::StreamCallback(TrackHandle& track,
                               const std::atomic<float>& volume,
                               std::atomic<bool>& suppress_auto_advance,
                               ProgressCallback on_progress,
                               int progress_every)
    : track_(track),
      volume_(volume),
      suppress_auto_advance_(suppress_auto_advance),
      on_progress_(std::move(on_progress)),
      progress_every_(std::max(progress_every, 1)) {
    scratch_.resize(kInitialScratchFrames * static_cast<std::size_t>(std::max(track_.channels(), 1)));
}

audio::RenderResult StreamCallback::render(float* out, std::size_t frames, int channels) {
    try {
        int src_channels = track_.channels();
        std::size_t needed = frames * static_cast<std::size_t>(src_channels);
        if (scratch_.size() < needed) {
            scratch_.resize(needed);
        }

        long before = track_.tell();
        int got = track_.read(scratch_.data(), static_cast<int>(frames));
        std::fill(scratch_.begin() + static_cast<std::ptrdiff_t>(got) * src_channels,
                  scratch_.begin() + static_cast<std::ptrdiff_t>(needed), 0.0f);

        write_frames(out, frames, channels, volume_.load(std::memory_order_relaxed));

        // Seeks only happen while the stream is down, so `before` is where
        // the previous period left off
        long position = track_.tell();
        bool stalled = position == before;

        if (cycle_ == 0 && on_progress_) {
            try {
                on_progress_(track_.info(), position);
            } catch (const std::exception& e) {
                util::Logger::warn(std::string("StreamCallback: Progress callback failed: ") + e.what());
            }
        }
        cycle_ = (cycle_ + 1) % progress_every_;

        return stalled ? audio::RenderResult::Abort : audio::RenderResult::Continue;
    } catch (const std::exception& e) {
        suppress_auto_advance_.store(true, std::memory_order_release);
        std::fill(out, out + frames * static_cast<std::size_t>(std::max(channels, 0)), 0.0f);
        util::Logger::error(std::string("StreamCallback: Aborting stream: ") + e.what());
        return audio::RenderResult::Abort;
    }
}

void StreamCallback::write_frames(float* out, std::size_t frames, int out_channels, float volume) const {
    const int src_channels = track_.channels();
    const float* src = scratch_.data();

    if (src_channels == out_channels) {
        std::size_t n = frames * static_cast<std::size_t>(out_channels);
        for (std::size_t i = 0; i < n; ++i) {
            out[i] = src[i] * volume;
        }
        return;
    }

    for (std::size_t f = 0; f < frames; ++f) {
        const float* in = src + f * src_channels;
        float* dst = out + f * out_channels;

        if (src_channels == 1) {
            std::fill(dst, dst + out_channels, in[0] * volume);
        } else if (out_channels == 1) {
            float sum = 0.0f;
            for (int c = 0; c < src_channels; ++c) sum += in[c];
            dst[0] = (sum / static_cast<float>(src_channels)) * volume;
        } else {
            for (int c = 0; c < out_channels; ++c) {
                dst[c] = in[std::min(c, src_channels - 1)] * volume;
            }
        }
    }
}

}  // namespace rondo::playback
