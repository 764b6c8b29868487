#pragma once

#include "error.hpp"

#include <cstdint>
#include <string>
#include <vector>

// Fixed capture format of every recording.
struct DeviceConfig {
    uint32_t sample_rate = 22050;
    uint16_t channels = 1;
    uint16_t sample_width = 2;        // signed 16-bit
    uint32_t frames_per_buffer = 1024;
    std::string node_name = "speech-corpus";
};

// Exclusively owned audio input. open() fails with a Device error while
// already open; read() returns at most `frames` samples and never waits
// longer than one buffer's duration.
class CaptureDevice {
public:
    virtual ~CaptureDevice() = default;
    virtual Result<void> open(const DeviceConfig& config) = 0;
    virtual Result<std::vector<int16_t>> read(uint32_t frames) = 0;
    virtual void close() = 0;
    virtual bool is_open() const = 0;
};
