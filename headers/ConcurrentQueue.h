#pragma once
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

/**
 * unbounded thread safe FIFO queue
 * pop() blocks until an item is available or the queue is closed and drained
 */
template <typename T>
class ConcurrentQueue
{
public:
    ConcurrentQueue() = default;
    ConcurrentQueue(const ConcurrentQueue &) = delete;
    ConcurrentQueue &operator=(const ConcurrentQueue &) = delete;

    // returns false (and drops the item) once the queue has been closed
    bool push(T item)
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_)
                return false;
            items_.push_back(std::move(item));
        }
        available_.notify_one();
        return true;
    }

    std::optional<T> pop()
    {
        std::unique_lock<std::mutex> lock(mutex_);
        available_.wait(lock, [this]
                        { return !items_.empty() || closed_; });
        return takeFront();
    }

    std::optional<T> tryPop()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return takeFront();
    }

    // wakes every blocked pop(), items already queued can still be drained
    void close()
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        available_.notify_all();
    }

    bool isClosed() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    size_t size() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

private:
    // mutex_ must be held
    std::optional<T> takeFront()
    {
        if (items_.empty())
            return std::nullopt;

        std::optional<T> item(std::move(items_.front()));
        items_.pop_front();
        return item;
    }

    mutable std::mutex mutex_;
    std::condition_variable available_;
    std::deque<T> items_;
    bool closed_ = false;
};
