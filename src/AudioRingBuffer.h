#pragma once

#include <atomic>
#include <deque>
#include <mutex>
#include <vector>

/*! Bounded hand-over between the audio callback and the capture worker.
 *
 *  push() never blocks. When the buffer is full, the oldest chunk is dropped.
 */
class AudioRingBuffer
{
public:
    using Chunk = std::vector<float>;

    static constexpr size_t default_max_chunks = 256;

    explicit AudioRingBuffer(size_t maxChunks = default_max_chunks)
        : max_chunks_{maxChunks} {}

    void push(Chunk &&chunk);

    // Takes everything that is queued, oldest first
    std::vector<Chunk> drain();

    void clear();

    size_t size() const;

    uint64_t droppedChunks() const noexcept {
        return dropped_.load(std::memory_order_relaxed);
    }

private:
    mutable std::mutex mutex_;
    std::deque<Chunk> queue_;
    const size_t max_chunks_;
    std::atomic_uint64_t dropped_{0};
};
