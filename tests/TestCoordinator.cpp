#include "Coordinator.h"
#include "TestHarness.h"

#include <future>
#include <stdexcept>
#include <string>

namespace
{
    static void runEmptyCoordinator()
    {
        Coordinator<int> coordinator;
        REQUIRE(!coordinator.waitNext().has_value(), "waitNext with nothing spawned must return nothing");
        REQUIRE(coordinator.waitAll().empty(), "waitAll with nothing spawned must be empty");
        std::cout << "[PASS] empty coordinator\n";
    }

    // one returns, one throws, one is held back until both others were collected
    static void runMixedOutcomes()
    {
        Coordinator<int> coordinator;
        std::promise<void> release;
        std::shared_future<void> released = release.get_future().share();

        coordinator.spawn([]()
                          { return 1; });
        coordinator.spawn([]() -> int
                          { throw std::runtime_error("boom"); });
        coordinator.spawn([released]()
                          {
            released.wait();
            return 3; });

        REQUIRE(coordinator.getSpawnedCount() == 3, "spawned count");

        bool sawValue = false;
        bool sawFault = false;
        for (int i = 0; i < 2; ++i)
        {
            auto outcome = coordinator.waitNext();
            REQUIRE(outcome.has_value(), "waitNext " << i << " returned nothing");
            if (outcome->isFault())
            {
                REQUIRE(outcome->faultMessage() == "boom", "fault message was '" << outcome->faultMessage() << "'");
                sawFault = true;
            }
            else
            {
                REQUIRE(outcome->value() == 1, "unexpected value " << outcome->value());
                sawValue = true;
            }
        }
        REQUIRE(sawValue && sawFault, "expected one value and one fault before the release");
        REQUIRE(coordinator.getActiveCount() == 1, "one thread should still be running");

        release.set_value();
        auto outcomes = coordinator.waitAll();
        REQUIRE(outcomes.size() == 3, "waitAll size " << outcomes.size());
        REQUIRE(!outcomes[0].has_value() && !outcomes[1].has_value(), "collected outcomes must be left empty");
        REQUIRE(outcomes[2].has_value() && !outcomes[2]->isFault(), "held back thread should succeed");
        REQUIRE(outcomes[2]->value() == 3, "held back value");
        REQUIRE(!coordinator.waitNext().has_value(), "nothing left to wait for");
        std::cout << "[PASS] mixed outcomes\n";
    }

    static void runWaitAllKeepsSpawnOrder()
    {
        Coordinator<std::string> coordinator;
        const int count = 5;
        for (int i = 0; i < count; ++i)
        {
            coordinator.spawn([i, count]()
                              {
                // later spawns finish first
                std::this_thread::sleep_for(std::chrono::milliseconds(10 * (count - i)));
                return std::to_string(i); });
        }

        auto outcomes = coordinator.waitAll();
        REQUIRE(outcomes.size() == static_cast<size_t>(count), "outcome count");
        for (int i = 0; i < count; ++i)
        {
            REQUIRE(outcomes[i].has_value(), "outcome " << i << " missing");
            REQUIRE(outcomes[i]->value() == std::to_string(i), "outcome " << i << " out of order");
        }
        std::cout << "[PASS] spawn order\n";
    }

    static void runNonStandardFault()
    {
        Coordinator<int> coordinator;
        coordinator.spawn([]() -> int
                          { throw 42; });

        auto outcome = coordinator.waitNext();
        REQUIRE(outcome.has_value() && outcome->isFault(), "expected a fault");
        REQUIRE(outcome->faultMessage() == "unknown fault", "message " << outcome->faultMessage());

        bool threwLogicError = false;
        try
        {
            (void)outcome->value();
        }
        catch (const std::logic_error &)
        {
            threwLogicError = true;
        }
        REQUIRE(threwLogicError, "value() of a fault must throw");

        bool rethrown = false;
        try
        {
            outcome->rethrow();
        }
        catch (int value)
        {
            rethrown = value == 42;
        }
        REQUIRE(rethrown, "rethrow should raise the original exception");
        std::cout << "[PASS] non standard fault\n";
    }
}

int main()
{
    runEmptyCoordinator();
    runMixedOutcomes();
    runWaitAllKeepsSpawnOrder();
    runNonStandardFault();
    std::cout << "All coordinator tests passed\n";
    return 0;
}
