#include "Supervisor.h"

ThreadResult superviseShutdown(Coordinator<ThreadResult> &coordinator, StopSignal stopWorld)
{
    while (auto outcome = coordinator.waitNext())
    {
        if (outcome->isFault())
            return "Drawing, world or robots thread panicked: " + outcome->faultMessage();
        if (outcome->value())
            return *outcome->value();

        // the world passes the stop on to every robot at the next tick
        if (!stopWorld.isRequested())
            stopWorld.request();
    }

    return std::nullopt;
}
