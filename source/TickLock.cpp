#include "TickLock.h"
#include <utility>

TickGuard::TickGuard(std::shared_lock<std::shared_mutex> running, TickLock &tickLock)
    : running_(std::move(running)), tickLock_(&tickLock)
{
}

TickGuard::TickGuard(TickGuard &&other) noexcept
    : running_(std::move(other.running_)), tickLock_(other.tickLock_), stopping_(other.stopping_)
{
    other.tickLock_ = nullptr;
}

TickGuard::~TickGuard()
{
    if (!tickLock_)
        return;

    // order matters: read lock goes before the barrier wait
    if (running_.owns_lock())
        running_.unlock();

    tickLock_->end_.wait();
}

void TickGuard::stop()
{
    if (!tickLock_ || stopping_)
        return;

    stopping_ = true;

    if (running_.owns_lock())
        running_.unlock();

    // can only be acquired once every other party has released its read lock for this tick
    std::unique_lock<std::shared_mutex> writeLock(tickLock_->runningMutex_);
    tickLock_->running_ = false;
}

TickLock::TickLock(size_t partyCount)
    : partyCount_(partyCount), start_(partyCount + 1), end_(partyCount + 1)
{
}

std::optional<TickGuard> TickLock::take()
{
    std::shared_lock<std::shared_mutex> readLock(runningMutex_);
    if (!running_)
        return std::nullopt;

    start_.wait();
    return TickGuard(std::move(readLock), *this);
}

bool TickLock::isRunning() const
{
    std::shared_lock<std::shared_mutex> readLock(runningMutex_);
    return running_;
}
