#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <vector>

// Lock-free single-producer single-consumer queue of 16-bit samples.
// The capture thread writes, the main loop drains. Samples that do not fit
// are dropped and counted.
class SampleRing {
public:
    explicit SampleRing(size_t capacity_samples)
        : buf_(capacity_samples), capacity_(capacity_samples) {}

    size_t write(const int16_t* samples, size_t count) {
        size_t w = write_pos_.load(std::memory_order_relaxed);
        size_t r = read_pos_.load(std::memory_order_acquire);

        size_t n = std::min(count, capacity_ - (w - r));
        if (n < count) dropped_.fetch_add(count - n, std::memory_order_relaxed);

        for (size_t i = 0; i < n; ++i) {
            buf_[(w + i) % capacity_] = samples[i];
        }
        write_pos_.store(w + n, std::memory_order_release);
        return n;
    }

    // Appends everything queued so far to `out`.
    size_t drain(std::vector<int16_t>& out) {
        size_t r = read_pos_.load(std::memory_order_relaxed);
        size_t w = write_pos_.load(std::memory_order_acquire);

        out.reserve(out.size() + (w - r));
        for (size_t i = r; i < w; ++i) {
            out.push_back(buf_[i % capacity_]);
        }
        read_pos_.store(w, std::memory_order_release);
        return w - r;
    }

    size_t dropped() const { return dropped_.load(std::memory_order_relaxed); }

private:
    std::vector<int16_t> buf_;
    size_t capacity_;
    alignas(64) std::atomic<size_t> write_pos_{0};
    alignas(64) std::atomic<size_t> read_pos_{0};
    std::atomic<size_t> dropped_{0};
};
