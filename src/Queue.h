#pragma once

#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>

/*! Unbounded multi-producer queue with a blocking pop.
 *
 *  After stop(), push() rejects new items, but pop() keeps returning the
 *  items already queued until the queue is empty.
 */
template <typename T>
class Queue
{
public:
    using type_t = T;

    Queue() = default;

    bool push(T && data)
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopped_) {
                return false;
            }
            queue_.push_back(std::move(data));
        }
        cv_.notify_one();
        return true;
    }

    bool pop(T &out)
    {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [&]{ return !queue_.empty() || stopped_; });
        if (queue_.empty()) {
            return false;
        }
        out = std::move(queue_.front());
        queue_.pop_front();
        return true;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

    bool stopped() const noexcept {
        return stopped_;
    }

    void stop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopped_ = true;
        }
        cv_.notify_all();
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<T> queue_;
    std::atomic_bool stopped_{false};
};
