#include "audio/PipeWireContext.hpp"
#include "audio/PipeWireOutput.hpp"
#include "playback/Errors.hpp"
#include "util/Logger.hpp"
#include <pipewire/pipewire.h>

namespace rondo::audio {

PipeWireContext::PipeWireContext() {
}

PipeWireContext::~PipeWireContext() {
    if (notifier_.joinable()) {
        notifier_.request_stop();
        queue_cv_.notify_all();
        notifier_.join();
    }
    if (loop_) {
        pw_thread_loop_stop(loop_);
        pw_thread_loop_destroy(loop_);
        loop_ = nullptr;
    }
    // Safe to leave initialized until process exit
    // pw_deinit();
}

bool PipeWireContext::init() {
    if (loop_) return true; // Already initialized

    pw_init(nullptr, nullptr);
    loop_ = pw_thread_loop_new("rondo-audio", nullptr);
    if (!loop_) {
        util::Logger::error("PipeWireContext: Failed to create thread loop");
        return false;
    }

    if (pw_thread_loop_start(loop_) < 0) {
        util::Logger::error("PipeWireContext: Failed to start thread loop");
        pw_thread_loop_destroy(loop_);
        loop_ = nullptr;
        return false;
    }

    notifier_ = std::jthread([this](std::stop_token st) { notifier_loop(st); });
    util::Logger::info("PipeWireContext: Initialized");
    return true;
}

std::unique_ptr<OutputStream> PipeWireContext::open_stream(int sample_rate, int channels,
                                                           std::unique_ptr<RenderSource> source,
                                                           FinishedCallback on_finished) {
    if (!loop_) {
        throw playback::DeviceError("PipeWire context is not initialized");
    }
    return std::make_unique<PipeWireOutput>(*this, sample_rate, channels,
                                            std::move(source), std::move(on_finished));
}

void PipeWireContext::post_finished(std::weak_ptr<FinishedCallback> callback,
                                    FinishReason reason, std::string detail) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        pending_.push_back({std::move(callback), reason, std::move(detail)});
    }
    queue_cv_.notify_one();
}

void PipeWireContext::notifier_loop(std::stop_token stop_token) {
    while (!stop_token.stop_requested()) {
        Notification next;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            if (!queue_cv_.wait(lock, stop_token, [this] { return !pending_.empty(); })) {
                break;  // Stop requested
            }
            next = std::move(pending_.front());
            pending_.pop_front();
        }

        if (auto callback = next.callback.lock()) {
            try {
                if (*callback) (*callback)(next.reason, next.detail);
            } catch (const std::exception& e) {
                util::Logger::error(std::string("PipeWireContext: Finished handler failed: ") + e.what());
            }
        } else {
            util::Logger::debug("PipeWireContext: Dropping notification for a closed stream");
        }
    }
}

} // namespace rondo::audio
