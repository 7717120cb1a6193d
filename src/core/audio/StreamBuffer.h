#pragma once

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <cstring>
#include <vector>

// Single-producer / single-consumer ring of interleaved float frames.
// The decode worker pushes, the render thread pops; neither blocks.
// One slot is kept free to tell full from empty.
class StreamBuffer {
public:
    StreamBuffer() = default;

    StreamBuffer(const StreamBuffer&) = delete;
    StreamBuffer& operator=(const StreamBuffer&) = delete;

    // Not thread-safe: call only while neither side is active.
    void resize(int capacityFrames, int channels)
    {
        m_channels = std::max(1, channels);
        m_size = size_t(std::max(1, capacityFrames) + 1);
        m_data.assign(m_size * m_channels, 0.0f);
        clear();
    }

    void clear()
    {
        m_writePos.store(0, std::memory_order_release);
        m_readPos.store(0, std::memory_order_release);
    }

    int channels() const { return m_channels; }
    int capacity() const { return int(m_size) - 1; }

    int available() const
    {
        size_t wp = m_writePos.load(std::memory_order_acquire);
        size_t rp = m_readPos.load(std::memory_order_acquire);
        return int((wp >= rp) ? (wp - rp) : (m_size - rp + wp));
    }

    int freeSpace() const { return capacity() - available(); }

    // Returns frames actually written.
    int push(const float* frames, int count)
    {
        count = std::min(count, freeSpace());
        if (count <= 0) return 0;

        size_t wp = m_writePos.load(std::memory_order_relaxed);
        size_t first = std::min(size_t(count), m_size - wp);

        std::memcpy(m_data.data() + wp * m_channels, frames,
                    first * m_channels * sizeof(float));
        if (first < size_t(count)) {
            std::memcpy(m_data.data(), frames + first * m_channels,
                        (count - first) * m_channels * sizeof(float));
        }

        m_writePos.store((wp + count) % m_size, std::memory_order_release);
        return count;
    }

    // Returns frames actually read.
    int pop(float* out, int count)
    {
        count = std::min(count, available());
        if (count <= 0) return 0;

        size_t rp = m_readPos.load(std::memory_order_relaxed);
        size_t first = std::min(size_t(count), m_size - rp);

        std::memcpy(out, m_data.data() + rp * m_channels,
                    first * m_channels * sizeof(float));
        if (first < size_t(count)) {
            std::memcpy(out + first * m_channels, m_data.data(),
                        (count - first) * m_channels * sizeof(float));
        }

        m_readPos.store((rp + count) % m_size, std::memory_order_release);
        return count;
    }

private:
    std::vector<float> m_data;
    size_t m_size = 1;
    int m_channels = 2;

    alignas(64) std::atomic<size_t> m_writePos{0};
    alignas(64) std::atomic<size_t> m_readPos{0};
};
