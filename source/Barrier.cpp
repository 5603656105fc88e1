#include "Barrier.h"
#include <algorithm>

Barrier::Barrier(size_t parties)
    : parties_(std::max(static_cast<size_t>(1), parties))
{
}

bool Barrier::wait()
{
    std::unique_lock<std::mutex> lock(mutex_);
    const size_t generation = generation_;

    if (++arrived_ == parties_)
    {
        // last to arrive opens the gate and resets the count for the next cycle
        arrived_ = 0;
        ++generation_;
        lock.unlock();
        released_.notify_all();
        return true;
    }

    released_.wait(lock, [this, generation]
                   { return generation != generation_; });
    return false;
}
