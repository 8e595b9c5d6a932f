#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <string>

namespace rondo::audio {

enum class RenderResult {
    Continue,
    Abort,  // Stop the stream after this period
};

// Pulled by the device's real-time thread once per period.
class RenderSource {
public:
    virtual ~RenderSource() = default;

    // Fill `frames` interleaved frames of `channels` samples each.
    virtual RenderResult render(float* out, std::size_t frames, int channels) = 0;
};

enum class FinishReason {
    Stopped,  // deactivate() or a drained Abort
    Failed,   // the device dropped the stream; detail carries its message
};

// Fired once each time a stream stops delivering render calls.
using FinishedCallback = std::function<void(FinishReason reason, const std::string& detail)>;

class OutputStream {
public:
    virtual ~OutputStream() = default;

    // Throws playback::DeviceError
    virtual void activate() = 0;

    // Blocks until the render source is no longer being called.
    virtual void deactivate() = 0;

    virtual bool is_active() const = 0;
};

class OutputDevice {
public:
    virtual ~OutputDevice() = default;

    // The stream is created inactive. Throws playback::DeviceError.
    virtual std::unique_ptr<OutputStream> open_stream(int sample_rate, int channels,
                                                      std::unique_ptr<RenderSource> source,
                                                      FinishedCallback on_finished) = 0;
};

}  // namespace rondo::audio
