#include "AudioRingBuffer.h"

void AudioRingBuffer::push(Chunk &&chunk)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (queue_.size() >= max_chunks_) {
        queue_.pop_front();
        ++dropped_;
    }
    queue_.push_back(std::move(chunk));
}

std::vector<AudioRingBuffer::Chunk> AudioRingBuffer::drain()
{
    std::vector<Chunk> chunks;
    std::lock_guard<std::mutex> lock(mutex_);
    chunks.reserve(queue_.size());
    for (auto& chunk : queue_) {
        chunks.push_back(std::move(chunk));
    }
    queue_.clear();
    return chunks;
}

void AudioRingBuffer::clear()
{
    std::lock_guard<std::mutex> lock(mutex_);
    queue_.clear();
    dropped_ = 0;
}

size_t AudioRingBuffer::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}
