#include "audio/PipeWireOutput.hpp"
#include "playback/Errors.hpp"
#include "util/Logger.hpp"
#include <pipewire/pipewire.h>
#include <spa/utils/result.h>
#include <spa/param/audio/format-utils.h>
#include <algorithm>
#include <cmath>

namespace rondo::audio {

static void on_process(void* userdata) {
    static_cast<PipeWireOutput*>(userdata)->process();
}

static void on_drained(void* userdata) {
    static_cast<PipeWireOutput*>(userdata)->drained();
}

static void on_state_changed(void* userdata, enum pw_stream_state old,
                             enum pw_stream_state state, const char* error) {
    (void)old;
    if (state == PW_STREAM_STATE_ERROR) {
        static_cast<PipeWireOutput*>(userdata)->stream_error(error);
    }
}

static const struct pw_stream_events stream_events = {
    .version = PW_VERSION_STREAM_EVENTS,
    .destroy = nullptr,
    .state_changed = on_state_changed,
    .control_info = nullptr,
    .io_changed = nullptr,
    .param_changed = nullptr,
    .add_buffer = nullptr,
    .remove_buffer = nullptr,
    .process = on_process,
    .drained = on_drained,
    .command = nullptr,
    .trigger_done = nullptr,
};

PipeWireOutput::PipeWireOutput(PipeWireContext& context, int sample_rate, int channels,
                               std::unique_ptr<RenderSource> source, FinishedCallback on_finished)
    : context_(context),
      sample_rate_(sample_rate),
      channels_(channels),
      source_(std::move(source)),
      on_finished_(std::make_shared<FinishedCallback>(std::move(on_finished))) {
    util::Logger::debug("PipeWireOutput: Initializing (" +
                        std::to_string(sample_rate) + "Hz, " +
                        std::to_string(channels) + "ch)");

    if (sample_rate_ <= 0 || channels_ <= 0) {
        throw playback::DeviceError("unsupported stream format " + std::to_string(sample_rate_) +
                                    "Hz/" + std::to_string(channels_) + "ch");
    }

    struct pw_thread_loop* loop = context_.get_loop();
    if (!loop) {
        throw playback::DeviceError("PipeWire thread loop is not running");
    }

    // CRITICAL: Lock the thread loop for all PipeWire operations
    pw_thread_loop_lock(loop);

    struct pw_properties* props = pw_properties_new(
        PW_KEY_MEDIA_TYPE, "Audio",
        PW_KEY_MEDIA_CATEGORY, "Playback",
        PW_KEY_MEDIA_ROLE, "Music",
        nullptr
    );

    stream_ = pw_stream_new_simple(
        pw_thread_loop_get_loop(loop),
        "Rondo Audio Player",
        props,
        &stream_events,
        this
    );

    if (!stream_) {
        pw_thread_loop_unlock(loop);
        throw playback::DeviceError("failed to create PipeWire stream");
    }

    uint8_t buffer[1024];
    struct spa_pod_builder builder = SPA_POD_BUILDER_INIT(buffer, sizeof(buffer));

    struct spa_audio_info_raw info = {};
    info.format = SPA_AUDIO_FORMAT_F32;
    info.channels = static_cast<uint32_t>(channels_);
    info.rate = static_cast<uint32_t>(sample_rate_);

    const struct spa_pod* params[1];
    params[0] = spa_format_audio_raw_build(&builder, SPA_PARAM_EnumFormat, &info);

    // Created inactive: nothing is pulled until activate()
    int result = pw_stream_connect(
        stream_,
        PW_DIRECTION_OUTPUT,
        PW_ID_ANY,
        static_cast<pw_stream_flags>(
            PW_STREAM_FLAG_AUTOCONNECT |
            PW_STREAM_FLAG_MAP_BUFFERS |
            PW_STREAM_FLAG_INACTIVE
        ),
        params, 1
    );

    pw_thread_loop_unlock(loop);

    if (result < 0) {
        close();
        throw playback::DeviceError(std::string("stream connect failed: ") + spa_strerror(result));
    }

    util::Logger::info("PipeWireOutput: Stream connected");
}

PipeWireOutput::~PipeWireOutput() {
    close();
    // Queued notifications for this stream expire with it
    on_finished_.reset();
}

void PipeWireOutput::close() {
    if (!stream_) return;

    util::Logger::debug("PipeWireOutput: Closing stream");
    struct pw_thread_loop* loop = context_.get_loop();
    if (loop) {
        pw_thread_loop_lock(loop);
        pw_stream_destroy(stream_);
        pw_thread_loop_unlock(loop);
    } else {
        pw_stream_destroy(stream_);
    }
    stream_ = nullptr;
    active_.store(false, std::memory_order_release);
}

void PipeWireOutput::activate() {
    struct pw_thread_loop* loop = context_.get_loop();
    if (!stream_ || !loop) {
        throw playback::DeviceError("stream is closed");
    }

    pw_thread_loop_lock(loop);
    int result = pw_stream_set_active(stream_, true);
    if (result >= 0) {
        draining_ = false;
        active_.store(true, std::memory_order_release);
    }
    pw_thread_loop_unlock(loop);

    if (result < 0) {
        throw playback::DeviceError(std::string("activate failed: ") + spa_strerror(result));
    }
    util::Logger::debug("PipeWireOutput: Activated");
}

void PipeWireOutput::deactivate() {
    struct pw_thread_loop* loop = context_.get_loop();
    if (!stream_ || !loop) return;

    // Holding the loop lock means no process() call is running; once the stream
    // is inactive none will start.
    pw_thread_loop_lock(loop);
    pw_stream_set_active(stream_, false);
    draining_ = false;
    bool was_active = active_.exchange(false, std::memory_order_acq_rel);
    pw_thread_loop_unlock(loop);

    util::Logger::debug("PipeWireOutput: Deactivated");
    if (was_active) {
        context_.post_finished(on_finished_);
    }
}

void PipeWireOutput::process() {
    struct pw_buffer* pw_buf = pw_stream_dequeue_buffer(stream_);
    if (!pw_buf) return;

    struct spa_buffer* buf = pw_buf->buffer;
    float* dst = static_cast<float*>(buf->datas[0].data);
    if (!dst) {
        pw_stream_queue_buffer(stream_, pw_buf);
        return;
    }

    uint32_t stride = sizeof(float) * static_cast<uint32_t>(channels_);
    uint32_t n_frames = buf->datas[0].maxsize / stride;
    if (pw_buf->requested > 0) {
        n_frames = std::min<uint32_t>(static_cast<uint32_t>(pw_buf->requested), n_frames);
    }
    size_t n_samples = static_cast<size_t>(n_frames) * channels_;

    bool finished = false;
    if (!active_.load(std::memory_order_acquire) || draining_) {
        std::fill(dst, dst + n_samples, 0.0f);
    } else {
        finished = source_->render(dst, n_frames, channels_) == RenderResult::Abort;
        sanitize(dst, n_samples);
    }

    buf->datas[0].chunk->offset = 0;
    buf->datas[0].chunk->stride = static_cast<int32_t>(stride);
    buf->datas[0].chunk->size = n_frames * stride;
    pw_stream_queue_buffer(stream_, pw_buf);

    if (finished) {
        // Let the queued tail play out; drained() completes the stop
        draining_ = true;
        pw_stream_flush(stream_, true);
    }
}

void PipeWireOutput::drained() {
    util::Logger::debug("PipeWireOutput: Drained");
    pw_stream_set_active(stream_, false);
    draining_ = false;
    if (active_.exchange(false, std::memory_order_acq_rel)) {
        context_.post_finished(on_finished_);
    }
}

void PipeWireOutput::stream_error(const char* error) {
    std::string message = error ? error : "unknown";
    util::Logger::error("PipeWireOutput: Stream error: " + message);
    draining_ = false;
    if (active_.exchange(false, std::memory_order_acq_rel)) {
        context_.post_finished(on_finished_, FinishReason::Failed, "stream error: " + message);
    }
}

void PipeWireOutput::sanitize(float* samples, size_t count) {
    for (size_t i = 0; i < count; ++i) {
        float val = samples[i];
        if (!std::isfinite(val)) {
            if (nan_count_ % 100 == 0) {
                util::Logger::warn("PipeWireOutput: NaN/Inf sample replaced (count=" +
                                   std::to_string(nan_count_) + ")");
            }
            nan_count_++;
            val = 0.0f;
        }
        samples[i] = std::clamp(val, -1.0f, 1.0f);
    }
}

} // namespace rondo::audio
