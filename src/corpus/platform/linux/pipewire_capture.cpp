#include "platform/linux/pipewire_capture.hpp"

#include <algorithm>
#include <chrono>
#include <format>
#include <print>
#include <span>
#include <spa/param/audio/format-utils.h>
#include <spa/utils/result.h>
#include <thread>

PipeWireCapture::PipeWireCapture(uint32_t buffer_seconds)
    : buffer_seconds_(buffer_seconds == 0 ? 1 : buffer_seconds) {
    pw_init(nullptr, nullptr);
}

PipeWireCapture::~PipeWireCapture() {
    close();
    pw_deinit();
}

Result<void> PipeWireCapture::open(const DeviceConfig& config) {
    if (open_.load(std::memory_order_relaxed)) {
        return make_error(ErrorKind::Device, "capture device is already open");
    }
    if (config.sample_width != 2) {
        return make_error(ErrorKind::Device,
                          std::format("unsupported sample width {} bytes", config.sample_width));
    }

    config_ = config;
    ring_buf_ = std::make_unique<RingBuffer>(
        static_cast<size_t>(buffer_seconds_) * config_.sample_rate * config_.channels);
    failed_.store(false, std::memory_order_relaxed);

    loop_ = pw_thread_loop_new(config_.node_name.c_str(), nullptr);
    if (!loop_) {
        return make_error(ErrorKind::Device, "failed to create PipeWire thread loop");
    }

    auto latency = std::format("{}/{}", config_.frames_per_buffer, config_.sample_rate);
    auto* props = pw_properties_new(
        PW_KEY_MEDIA_TYPE, "Audio",
        PW_KEY_MEDIA_CATEGORY, "Capture",
        PW_KEY_MEDIA_ROLE, "Production",
        PW_KEY_NODE_NAME, config_.node_name.c_str(),
        PW_KEY_APP_NAME, "speech-corpus",
        PW_KEY_NODE_LATENCY, latency.c_str(),
        nullptr
    );

    stream_ = pw_stream_new_simple(
        pw_thread_loop_get_loop(loop_),
        "speech-corpus-capture",
        props,
        &stream_events_,
        this
    );

    if (!stream_) {
        destroy_stream();
        return make_error(ErrorKind::Device, "failed to create PipeWire stream");
    }

    // S16_LE at the configured rate and channel count
    uint8_t buf[1024];
    spa_pod_builder b = SPA_POD_BUILDER_INIT(buf, sizeof(buf));
    auto info = SPA_AUDIO_INFO_RAW_INIT(
        .format = SPA_AUDIO_FORMAT_S16_LE,
        .rate = config_.sample_rate,
        .channels = config_.channels
    );
    const spa_pod* params[1];
    params[0] = spa_format_audio_raw_build(&b, SPA_PARAM_EnumFormat, &info);

    int ret = pw_stream_connect(
        stream_,
        PW_DIRECTION_INPUT,
        PW_ID_ANY,
        static_cast<pw_stream_flags>(
            PW_STREAM_FLAG_AUTOCONNECT | PW_STREAM_FLAG_MAP_BUFFERS | PW_STREAM_FLAG_RT_PROCESS
        ),
        params, 1
    );

    if (ret < 0) {
        destroy_stream();
        return make_error(ErrorKind::Device, std::format("stream connect failed: {}", spa_strerror(ret)));
    }

    // Set before the loop starts so the first callbacks are kept.
    open_.store(true, std::memory_order_release);

    ret = pw_thread_loop_start(loop_);
    if (ret < 0) {
        open_.store(false, std::memory_order_release);
        destroy_stream();
        return make_error(ErrorKind::Device, std::format("thread loop start failed: {}", spa_strerror(ret)));
    }

    return {};
}

Result<std::vector<int16_t>> PipeWireCapture::read(uint32_t frames) {
    if (!open_.load(std::memory_order_acquire)) {
        return make_error(ErrorKind::Device, "capture device is not open");
    }

    const size_t wanted = static_cast<size_t>(frames) * config_.channels;
    const auto budget = std::chrono::microseconds(
        static_cast<int64_t>(frames) * 1'000'000 / config_.sample_rate);
    const auto deadline = std::chrono::steady_clock::now() + budget;

    while (ring_buf_->available() < wanted) {
        if (failed_.load(std::memory_order_acquire)) {
            return make_error(ErrorKind::Device, "capture stream entered error state");
        }
        if (std::chrono::steady_clock::now() >= deadline) break;
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }

    // Whole frames only
    size_t take = std::min(wanted, ring_buf_->available());
    take -= take % config_.channels;

    std::vector<int16_t> samples(take);
    ring_buf_->read(samples);
    return samples;
}

void PipeWireCapture::close() {
    if (!open_.exchange(false, std::memory_order_acq_rel)) return;

    if (loop_) {
        pw_thread_loop_stop(loop_);
    }
    destroy_stream();

    if (ring_buf_ && ring_buf_->dropped() > 0) {
        std::println(stderr, "audio: ring buffer overflow, {} samples dropped", ring_buf_->dropped());
    }
}

void PipeWireCapture::destroy_stream() {
    if (stream_) {
        pw_stream_destroy(stream_);
        stream_ = nullptr;
    }
    if (loop_) {
        pw_thread_loop_destroy(loop_);
        loop_ = nullptr;
    }
}

void PipeWireCapture::on_process(void* userdata) {
    auto* self = static_cast<PipeWireCapture*>(userdata);

    auto* buf = pw_stream_dequeue_buffer(self->stream_);
    if (!buf) return;

    auto* d = &buf->buffer->datas[0];
    if (!d->data) {
        pw_stream_queue_buffer(self->stream_, buf);
        return;
    }

    auto* data = reinterpret_cast<const int16_t*>(static_cast<const uint8_t*>(d->data) + d->chunk->offset);
    size_t count = d->chunk->size / sizeof(int16_t);

    if (self->open_.load(std::memory_order_relaxed)) {
        self->ring_buf_->write(std::span<const int16_t>(data, count));
    }

    pw_stream_queue_buffer(self->stream_, buf);
}

void PipeWireCapture::on_state_changed(void* userdata, enum pw_stream_state old,
                                       enum pw_stream_state state, const char* error) {
    auto* self = static_cast<PipeWireCapture*>(userdata);
    if (state == PW_STREAM_STATE_ERROR) {
        self->failed_.store(true, std::memory_order_release);
    }
    if (error) {
        std::println(stderr, "audio: stream state {} -> {}: {}",
                     pw_stream_state_as_string(old),
                     pw_stream_state_as_string(state),
                     error);
    }
}
