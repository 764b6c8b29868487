#pragma once

#include "platform/capture_device.hpp"
#include "ring_buffer.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <pipewire/pipewire.h>
#include <spa/param/audio/format-utils.h>

// PipeWire input stream. The realtime process callback pushes samples into a
// ring buffer; read() drains it from the polling thread.
class PipeWireCapture : public CaptureDevice {
public:
    explicit PipeWireCapture(uint32_t buffer_seconds = 4);
    ~PipeWireCapture() override;

    PipeWireCapture(const PipeWireCapture&) = delete;
    PipeWireCapture& operator=(const PipeWireCapture&) = delete;

    Result<void> open(const DeviceConfig& config) override;
    Result<std::vector<int16_t>> read(uint32_t frames) override;
    void close() override;
    bool is_open() const override { return open_.load(std::memory_order_relaxed); }

private:
    static void on_process(void* userdata);
    static void on_state_changed(void* userdata, enum pw_stream_state old,
                                 enum pw_stream_state state, const char* error);

    void destroy_stream();

    uint32_t buffer_seconds_;
    DeviceConfig config_;
    std::unique_ptr<RingBuffer> ring_buf_;
    std::atomic<bool> open_{false};
    std::atomic<bool> failed_{false};

    pw_thread_loop* loop_ = nullptr;
    pw_stream* stream_ = nullptr;

    static constexpr pw_stream_events stream_events_ = {
        .version = PW_VERSION_STREAM_EVENTS,
        .state_changed = on_state_changed,
        .process = on_process,
    };
};
