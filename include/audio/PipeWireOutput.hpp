#pragma once

#include "audio/OutputDevice.hpp"
#include "audio/PipeWireContext.hpp"
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>

struct pw_stream;

namespace rondo::audio {

// One pull-mode playback stream. The process callback runs on the context's
// thread loop and asks the RenderSource for each period.
class PipeWireOutput : public OutputStream {
public:
    // Throws playback::DeviceError if the stream cannot be created or connected
    PipeWireOutput(PipeWireContext& context, int sample_rate, int channels,
                   std::unique_ptr<RenderSource> source, FinishedCallback on_finished);
    ~PipeWireOutput() override;

    PipeWireOutput(const PipeWireOutput&) = delete;
    PipeWireOutput& operator=(const PipeWireOutput&) = delete;

    void activate() override;
    void deactivate() override;
    bool is_active() const override { return active_.load(std::memory_order_acquire); }

    int get_sample_rate() const { return sample_rate_; }
    int get_channels() const { return channels_; }

    // pw_stream_events trampolines land here, always with the loop lock held
    void process();
    void drained();
    void stream_error(const char* error);

private:
    void close();
    void sanitize(float* samples, size_t count);

    PipeWireContext& context_;
    int sample_rate_ = 0;
    int channels_ = 0;

    std::unique_ptr<RenderSource> source_;
    std::shared_ptr<FinishedCallback> on_finished_;

    struct pw_stream* stream_ = nullptr;
    std::atomic<bool> active_{false};
    bool draining_ = false;
    uint64_t nan_count_ = 0;
};

} // namespace rondo::audio
