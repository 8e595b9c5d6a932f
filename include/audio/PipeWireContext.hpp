#pragma once

#include "audio/OutputDevice.hpp"
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

struct pw_thread_loop;

namespace rondo::audio {

// Output device backed by a PipeWire thread loop. Finished notifications are
// delivered on a dedicated notifier thread so handlers may freely reopen streams.
class PipeWireContext : public OutputDevice {
public:
    PipeWireContext();
    ~PipeWireContext() override;

    [[nodiscard]] bool init();
    struct pw_thread_loop* get_loop() const { return loop_; }

    std::unique_ptr<OutputStream> open_stream(int sample_rate, int channels,
                                              std::unique_ptr<RenderSource> source,
                                              FinishedCallback on_finished) override;

    // Expired callbacks are dropped when their turn comes.
    void post_finished(std::weak_ptr<FinishedCallback> callback,
                       FinishReason reason = FinishReason::Stopped,
                       std::string detail = {});

private:
    struct Notification {
        std::weak_ptr<FinishedCallback> callback;
        FinishReason reason;
        std::string detail;
    };

    void notifier_loop(std::stop_token stop_token);

    struct pw_thread_loop* loop_ = nullptr;

    std::mutex queue_mutex_;
    std::condition_variable_any queue_cv_;
    std::deque<Notification> pending_;
    std::jthread notifier_;
};

} // namespace rondo::audio
