#include "audio_buffer.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <limits>

AudioBuffer::AudioBuffer(AudioFormat format, std::vector<uint8_t> pcm)
    : format_(format), pcm_(std::move(pcm)) {
    // Drop a trailing partial frame.
    size_t fw = format_.frame_width();
    if (fw > 0) pcm_.resize(pcm_.size() - pcm_.size() % fw);
}

AudioBuffer AudioBuffer::from_samples(std::span<const int16_t> samples, uint32_t sample_rate) {
    std::vector<uint8_t> pcm(samples.size() * sizeof(int16_t));
    if (!pcm.empty()) std::memcpy(pcm.data(), samples.data(), pcm.size());
    return AudioBuffer(AudioFormat{.sample_rate = sample_rate, .channels = 1, .sample_width = 2},
                       std::move(pcm));
}

size_t AudioBuffer::frame_count() const {
    size_t fw = format_.frame_width();
    return fw == 0 ? 0 : pcm_.size() / fw;
}

size_t AudioBuffer::length_ms() const {
    if (format_.sample_rate == 0) return 0;
    uint64_t frames = frame_count();
    return static_cast<size_t>((frames * 1000 + format_.sample_rate / 2) / format_.sample_rate);
}

size_t AudioBuffer::frame_at_ms(size_t ms) const {
    uint64_t frame = static_cast<uint64_t>(ms) * format_.sample_rate / 1000;
    return static_cast<size_t>(std::min<uint64_t>(frame, frame_count()));
}

AudioBuffer AudioBuffer::slice(size_t start_ms, size_t end_ms) const {
    size_t first = frame_at_ms(start_ms);
    size_t last = frame_at_ms(end_ms);
    if (last <= first) return AudioBuffer(format_, {});

    size_t fw = format_.frame_width();
    std::vector<uint8_t> out(pcm_.begin() + static_cast<std::ptrdiff_t>(first * fw),
                             pcm_.begin() + static_cast<std::ptrdiff_t>(last * fw));
    return AudioBuffer(format_, std::move(out));
}

AudioBuffer AudioBuffer::reversed() const {
    size_t fw = format_.frame_width();
    size_t frames = frame_count();
    std::vector<uint8_t> out(pcm_.size());
    for (size_t i = 0; i < frames; ++i) {
        std::memcpy(out.data() + i * fw, pcm_.data() + (frames - 1 - i) * fw, fw);
    }
    return AudioBuffer(format_, std::move(out));
}

int32_t AudioBuffer::sample_at(size_t off) const {
    const uint8_t* p = pcm_.data() + off;
    switch (format_.sample_width) {
        case 1:
            return static_cast<int32_t>(p[0]) - 128;
        case 2: {
            int16_t v;
            std::memcpy(&v, p, 2);
            return v;
        }
        case 3: {
            int32_t v = p[0] | (p[1] << 8) | (p[2] << 16);
            if (v & 0x800000) v -= 0x1000000;
            return v;
        }
        case 4: {
            int32_t v;
            std::memcpy(&v, p, 4);
            return v;
        }
    }
    return 0;
}

double AudioBuffer::rms() const {
    size_t width = format_.sample_width;
    if (width == 0 || pcm_.empty()) return 0.0;

    size_t count = pcm_.size() / width;
    double sum = 0.0;
    for (size_t i = 0; i < count; ++i) {
        double s = sample_at(i * width);
        sum += s * s;
    }
    return std::floor(std::sqrt(sum / static_cast<double>(count)));
}

double AudioBuffer::max_possible_amplitude() const {
    return std::ldexp(1.0, format_.sample_width * 8 - 1);
}

double AudioBuffer::dbfs() const {
    double level = rms();
    if (level == 0.0) return -std::numeric_limits<double>::infinity();
    return 20.0 * std::log10(level / max_possible_amplitude());
}
