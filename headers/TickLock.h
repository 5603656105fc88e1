#pragma once
#include "Barrier.h"
#include <cstddef>
#include <mutex>
#include <optional>
#include <shared_mutex>

class TickLock;

/**
 * token for one tick, owned by the thread that took it
 * holds a read lock on the tick lock's running flag for as long as the party is inside
 * the tick, and performs the end of tick barrier wait when destroyed
 */
class TickGuard
{
public:
    TickGuard(TickGuard &&other) noexcept;
    TickGuard &operator=(TickGuard &&) = delete;
    TickGuard(const TickGuard &) = delete;
    TickGuard &operator=(const TickGuard &) = delete;

    // releases the read lock first so a stopping world never waits on a party that is only finishing its tick
    ~TickGuard();

    // world only: halts every future tick
    // blocks until every other party has left the current tick segment, then clears the running flag.
    // the end of tick barrier wait still happens when the guard is destroyed
    void stop();

    bool isStopping() const { return stopping_; }

private:
    friend class TickLock;
    TickGuard(std::shared_lock<std::shared_mutex> running, TickLock &tickLock);

    std::shared_lock<std::shared_mutex> running_;
    TickLock *tickLock_; // null once moved from
    bool stopping_ = false;
};

/**
 * double barrier rendezvous for N agents plus the world
 * every party calls take() once per tick: all of them are admitted together through the start barrier
 * and leave together through the end barrier when their guards are dropped.
 * once the world stops the lock, take() returns nothing forever without touching the barriers
 */
class TickLock
{
public:
    explicit TickLock(size_t partyCount);
    ~TickLock() = default;

    TickLock(const TickLock &) = delete;
    TickLock &operator=(const TickLock &) = delete;

    std::optional<TickGuard> take();

    bool isRunning() const;
    size_t getPartyCount() const { return partyCount_; }

private:
    friend class TickGuard;

    const size_t partyCount_;
    Barrier start_;
    Barrier end_;

    mutable std::shared_mutex runningMutex_;
    bool running_ = true;
};
