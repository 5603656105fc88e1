#pragma once
#include "Coordinator.h"
#include "StopSignal.h"
#include <optional>
#include <string>

// empty when a supervised thread finished cleanly, otherwise what went wrong
using ThreadResult = std::optional<std::string>;

/**
 * collects the top level threads in completion order
 * the first clean finish asks the world to stop, the first fault or error ends the wait straight away:
 * a failed agent never reaches the next tick, so the threads still running may never finish.
 * returns empty once every thread has finished cleanly
 */
ThreadResult superviseShutdown(Coordinator<ThreadResult> &coordinator, StopSignal stopWorld);

// waits on every robot thread, the first fault or error ends the wait
template <typename Status>
ThreadResult superviseRobots(Coordinator<Status> &robots)
{
    while (auto outcome = robots.waitNext())
    {
        if (outcome->isFault())
            return "Robot thread panicked: " + outcome->faultMessage();
        if (outcome->value())
            return "Robot thread returned error: " + outcome->value()->describe();
    }
    return std::nullopt;
}
