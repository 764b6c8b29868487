#pragma once

#include "audio_buffer.hpp"
#include "platform/capture_device.hpp"
#include "wav.hpp"

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <unistd.h>
#include <vector>

namespace test {

// RAII temp directory that auto-deletes.
struct TmpDir {
    std::filesystem::path path;

    TmpDir() {
        static int counter = 0;
        path = std::filesystem::temp_directory_path() /
               ("sc_test_" + std::to_string(getpid()) + "_" + std::to_string(counter++));
        std::filesystem::remove_all(path);
        std::filesystem::create_directories(path);
    }

    ~TmpDir() {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    std::string str() const { return path.string(); }
};

inline void write_text(const std::filesystem::path& p, const std::string& content) {
    std::filesystem::create_directories(p.parent_path());
    std::ofstream f(p, std::ios::binary | std::ios::trunc);
    f << content;
}

inline std::string read_text(const std::filesystem::path& p) {
    std::ifstream f(p, std::ios::binary);
    return {std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>()};
}

// Mono 16-bit buffer: `lead_ms` of silence, `tone_ms` of a loud square wave,
// `tail_ms` of silence.
inline AudioBuffer padded_tone(uint32_t rate, size_t lead_ms, size_t tone_ms, size_t tail_ms,
                               int16_t amplitude = 16000) {
    std::vector<int16_t> samples;
    auto frames = [rate](size_t ms) { return static_cast<size_t>(ms) * rate / 1000; };
    samples.insert(samples.end(), frames(lead_ms), 0);
    for (size_t i = 0; i < frames(tone_ms); ++i) {
        samples.push_back((i / 8) % 2 == 0 ? amplitude : static_cast<int16_t>(-amplitude));
    }
    samples.insert(samples.end(), frames(tail_ms), 0);
    return AudioBuffer::from_samples(samples, rate);
}

inline void write_wav(const std::filesystem::path& p, const AudioBuffer& audio) {
    std::filesystem::create_directories(p.parent_path());
    auto bytes = wav::encode(audio);
    std::ofstream f(p, std::ios::binary | std::ios::trunc);
    f.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
}

// Scripted capture device: every read returns samples of `level`, as many as
// asked for unless `frames_per_read` caps it.
class MockCaptureDevice : public CaptureDevice {
public:
    Result<void> open(const DeviceConfig& config) override {
        if (open_) return make_error(ErrorKind::Device, "capture device is already open");
        if (fail_open) return make_error(ErrorKind::Device, "no such device");
        open_ = true;
        opens++;
        last_config = config;
        return {};
    }

    Result<std::vector<int16_t>> read(uint32_t frames) override {
        if (!open_) return make_error(ErrorKind::Device, "capture device is not open");
        reads++;
        if (fail_read_after >= 0 && reads > fail_read_after) {
            return make_error(ErrorKind::Device, "stream lost");
        }
        size_t n = frames_per_read < 0 ? frames : std::min<size_t>(frames, frames_per_read);
        return std::vector<int16_t>(n, level);
    }

    void close() override {
        if (open_) closes++;
        open_ = false;
    }

    bool is_open() const override { return open_; }

    bool fail_open = false;
    int fail_read_after = -1;
    int frames_per_read = -1;
    int16_t level = 1000;
    int opens = 0;
    int reads = 0;
    int closes = 0;
    DeviceConfig last_config;

private:
    bool open_ = false;
};

} // namespace test
