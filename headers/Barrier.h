#pragma once
#include <condition_variable>
#include <cstddef>
#include <mutex>

/**
 * reusable cyclic barrier
 * every party blocks in wait() until the configured number of parties arrived,
 * then all of them are released together and the barrier resets for the next cycle
 */
class Barrier
{
public:
    explicit Barrier(size_t parties);
    ~Barrier() = default;

    Barrier(const Barrier &) = delete;
    Barrier &operator=(const Barrier &) = delete;

    // returns true for exactly one party per cycle (the last one to arrive)
    bool wait();

    size_t getPartyCount() const { return parties_; }

private:
    std::mutex mutex_;
    std::condition_variable released_;

    const size_t parties_;
    size_t arrived_ = 0;
    size_t generation_ = 0; // bumped each time a full cycle is released
};
