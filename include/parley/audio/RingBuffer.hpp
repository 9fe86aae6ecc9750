/**
 * RingBuffer.hpp - Lock-free single-producer/single-consumer sample buffer
 *
 * Feeds the PortAudio output callback: the speech queue thread pushes, the
 * audio callback pops. clear() is a consumer-side operation.
 */

#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <vector>

namespace parley::audio {

template <typename T>
class RingBuffer {
public:
    explicit RingBuffer(size_t capacity)
        : buffer_(capacity + 1)
        , capacity_(capacity + 1)
    {}

    /** Copy up to `count` items in. Returns how many fit. */
    size_t push(const T* data, size_t count) {
        const size_t write = write_.load(std::memory_order_relaxed);
        const size_t read = read_.load(std::memory_order_acquire);

        size_t free = (read + capacity_ - write - 1) % capacity_;
        size_t n = std::min(count, free);

        for (size_t i = 0; i < n; ++i) {
            buffer_[(write + i) % capacity_] = data[i];
        }

        write_.store((write + n) % capacity_, std::memory_order_release);
        return n;
    }

    /** Copy up to `count` items out. Returns how many were read. */
    size_t pop(T* out, size_t count) {
        const size_t read = read_.load(std::memory_order_relaxed);
        const size_t write = write_.load(std::memory_order_acquire);

        size_t used = (write + capacity_ - read) % capacity_;
        size_t n = std::min(count, used);

        for (size_t i = 0; i < n; ++i) {
            out[i] = buffer_[(read + i) % capacity_];
        }

        read_.store((read + n) % capacity_, std::memory_order_release);
        return n;
    }

    size_t available() const {
        const size_t read = read_.load(std::memory_order_acquire);
        const size_t write = write_.load(std::memory_order_acquire);
        return (write + capacity_ - read) % capacity_;
    }

    size_t capacity() const { return capacity_ - 1; }

    /** Drop everything currently buffered. */
    void clear() {
        read_.store(write_.load(std::memory_order_acquire), std::memory_order_release);
    }

private:
    std::vector<T> buffer_;
    const size_t capacity_;
    std::atomic<size_t> read_{0};
    std::atomic<size_t> write_{0};
};

} // namespace parley::audio
