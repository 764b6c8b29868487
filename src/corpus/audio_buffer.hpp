#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

struct AudioFormat {
    uint32_t sample_rate = 22050;
    uint16_t channels = 1;
    uint16_t sample_width = 2; // bytes per sample

    size_t frame_width() const { return static_cast<size_t>(channels) * sample_width; }

    bool operator==(const AudioFormat&) const = default;
};

// Decoded interleaved PCM, addressed in milliseconds.
//
// 8-bit samples are unsigned (WAV convention); wider samples are signed
// little-endian. Millisecond positions map to frame (ms * rate / 1000),
// truncated and clamped to the buffer.
class AudioBuffer {
public:
    AudioBuffer() = default;
    AudioBuffer(AudioFormat format, std::vector<uint8_t> pcm);

    // Mono 16-bit buffer from native samples.
    static AudioBuffer from_samples(std::span<const int16_t> samples, uint32_t sample_rate);

    const AudioFormat& format() const { return format_; }
    const std::vector<uint8_t>& data() const { return pcm_; }

    size_t frame_count() const;
    size_t length_ms() const;
    bool empty() const { return frame_count() == 0; }

    // Frames in [start_ms, end_ms). Empty when end_ms <= start_ms.
    AudioBuffer slice(size_t start_ms, size_t end_ms) const;

    // Same frames in reverse order; channel order within a frame is kept.
    AudioBuffer reversed() const;

    // Integer root mean square over every sample of every channel.
    double rms() const;

    // Level in decibels relative to full scale; -infinity for silence or an
    // empty buffer.
    double dbfs() const;

    double max_possible_amplitude() const;

    bool operator==(const AudioBuffer&) const = default;

private:
    size_t frame_at_ms(size_t ms) const;
    int32_t sample_at(size_t byte_offset) const;

    AudioFormat format_;
    std::vector<uint8_t> pcm_;
};
