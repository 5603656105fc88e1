#pragma once
#include <cstddef>
#include <mutex>
#include <utility>
#include <vector>

/**
 * shared, lock protected batch of public snapshots
 * the writer replaces the whole batch at once, readers always get a full copy of one batch
 */
template <typename T>
class SnapshotBoard
{
public:
    SnapshotBoard() = default;
    explicit SnapshotBoard(std::vector<T> initial)
        : snapshots_(std::move(initial))
    {
    }

    SnapshotBoard(const SnapshotBoard &) = delete;
    SnapshotBoard &operator=(const SnapshotBoard &) = delete;

    void publish(std::vector<T> snapshots)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        snapshots_ = std::move(snapshots);
        ++generation_;
    }

    std::vector<T> read() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return snapshots_;
    }

    size_t size() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return snapshots_.size();
    }

    // number of batches published so far
    size_t getGeneration() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return generation_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<T> snapshots_;
    size_t generation_ = 0;
};
