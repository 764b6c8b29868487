#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <vector>

// Lock-free single-producer single-consumer ring of int16 samples.
// Producer (PipeWire thread) calls write(). Consumer (polling thread) calls read().
// Samples that do not fit are dropped and counted.
class RingBuffer {
public:
    explicit RingBuffer(size_t capacity_samples)
        : buf_(capacity_samples), capacity_(capacity_samples) {}

    // Producer: returns samples actually stored.
    size_t write(std::span<const int16_t> samples) {
        size_t w = write_pos_.load(std::memory_order_relaxed);
        size_t r = read_pos_.load(std::memory_order_acquire);

        size_t room = capacity_ - (w - r);
        size_t n = std::min(samples.size(), room);
        if (n < samples.size()) {
            dropped_.fetch_add(samples.size() - n, std::memory_order_relaxed);
        }
        if (n == 0) return 0;

        size_t offset = w % capacity_;
        size_t first = std::min(n, capacity_ - offset);
        std::memcpy(buf_.data() + offset, samples.data(), first * sizeof(int16_t));
        if (first < n) {
            std::memcpy(buf_.data(), samples.data() + first, (n - first) * sizeof(int16_t));
        }

        write_pos_.store(w + n, std::memory_order_release);
        return n;
    }

    // Consumer: fills up to dest.size() samples, returns the count.
    size_t read(std::span<int16_t> dest) {
        size_t r = read_pos_.load(std::memory_order_relaxed);
        size_t w = write_pos_.load(std::memory_order_acquire);

        size_t n = std::min(dest.size(), w - r);
        if (n == 0) return 0;

        size_t offset = r % capacity_;
        size_t first = std::min(n, capacity_ - offset);
        std::memcpy(dest.data(), buf_.data() + offset, first * sizeof(int16_t));
        if (first < n) {
            std::memcpy(dest.data() + first, buf_.data(), (n - first) * sizeof(int16_t));
        }

        read_pos_.store(r + n, std::memory_order_release);
        return n;
    }

    size_t available() const {
        size_t w = write_pos_.load(std::memory_order_acquire);
        size_t r = read_pos_.load(std::memory_order_acquire);
        return w - r;
    }

    size_t capacity() const { return capacity_; }
    size_t dropped() const { return dropped_.load(std::memory_order_relaxed); }

    // Only while the producer is stopped.
    void reset() {
        read_pos_.store(0, std::memory_order_relaxed);
        write_pos_.store(0, std::memory_order_relaxed);
        dropped_.store(0, std::memory_order_relaxed);
    }

private:
    std::vector<int16_t> buf_;
    size_t capacity_;
    alignas(64) std::atomic<size_t> write_pos_{0};
    alignas(64) std::atomic<size_t> read_pos_{0};
    std::atomic<size_t> dropped_{0};
};
