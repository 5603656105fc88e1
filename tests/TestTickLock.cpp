#include "Barrier.h"
#include "TestHarness.h"
#include "TickLock.h"

#include <atomic>
#include <thread>
#include <vector>

namespace
{
    static void runBarrierReleasesOneLeaderPerCycle()
    {
        const size_t parties = 4;
        const int cycles = 50;
        Barrier barrier(parties);
        std::atomic<int> leaders{0};

        std::vector<std::thread> threads;
        for (size_t i = 0; i < parties; ++i)
        {
            threads.emplace_back([&]()
                                 {
                for (int c = 0; c < cycles; ++c)
                {
                    if (barrier.wait())
                        ++leaders;
                } });
        }
        for (auto &t : threads)
            t.join();

        REQUIRE(leaders.load() == cycles, "expected one leader per cycle, got " << leaders.load());
        std::cout << "[PASS] barrier cycles\n";
    }

    static void runWorldAloneTicks()
    {
        TickLock tickLock(0);
        REQUIRE(tickLock.getPartyCount() == 0, "party count");

        for (int i = 0; i < 10; ++i)
        {
            auto guard = tickLock.take();
            REQUIRE(guard.has_value(), "lone world should get tick " << i);
        }

        {
            auto guard = tickLock.take();
            REQUIRE(guard.has_value(), "final tick");
            guard->stop();
            REQUIRE(guard->isStopping(), "guard should report stopping");
        }

        REQUIRE(!tickLock.isRunning(), "lock should be stopped");
        REQUIRE(!tickLock.take().has_value(), "take after stop must return nothing");
        std::cout << "[PASS] zero agents\n";
    }

    // nobody may start round r+1 before every party has finished round r
    static void runPartiesStayInLockstep()
    {
        const size_t agents = 6;
        const int rounds = 200;
        TickLock tickLock(agents);

        std::vector<std::atomic<int>> finished(rounds + 2);
        for (auto &f : finished)
            f.store(0);

        auto party = [&](bool isWorld)
        {
            int round = 0;
            while (true)
            {
                auto guard = tickLock.take();
                if (!guard)
                    break;
                ++round;

                REQUIRE(finished[round - 1].load() == static_cast<int>(agents + 1) || round == 1,
                        "round " << round - 1 << " was not finished by everyone");
                REQUIRE(finished[round + 1].load() == 0, "someone is already in round " << round + 1);

                std::this_thread::yield();
                ++finished[round];

                if (isWorld && round == rounds)
                    guard->stop();
            }
            REQUIRE(round == rounds, "party saw " << round << " rounds instead of " << rounds);
        };

        std::vector<std::thread> threads;
        for (size_t i = 0; i < agents; ++i)
            threads.emplace_back(party, false);
        party(true);
        for (auto &t : threads)
            t.join();

        for (int r = 1; r <= rounds; ++r)
            REQUIRE(finished[r].load() == static_cast<int>(agents + 1), "round " << r << " incomplete");

        std::cout << "[PASS] lockstep rounds\n";
    }

    // stop() has to wait for agents still working inside the tick
    static void runStopWaitsForAgentsInTick()
    {
        TickLock tickLock(1);
        std::atomic<bool> agentDone{false};
        std::atomic<bool> agentInTick{false};
        int agentTicks = 0;

        std::thread agent([&]()
                          {
            while (auto guard = tickLock.take())
            {
                ++agentTicks;
                agentInTick = true;
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
                agentDone = true;
            } });

        {
            auto guard = tickLock.take();
            REQUIRE(guard.has_value(), "world tick");
            REQUIRE(waitUntil([&]()
                              { return agentInTick.load(); }),
                    "agent never entered its tick");
            guard->stop();
            REQUIRE(agentDone.load(), "stop returned while the agent was still inside the tick");
        }

        agent.join();
        REQUIRE(agentTicks == 1, "agent should have run exactly one tick, ran " << agentTicks);
        std::cout << "[PASS] stop waits for tick\n";
    }

    static void runMovedGuardEndsTickOnce()
    {
        TickLock tickLock(1);
        std::atomic<int> agentTicks{0};

        std::thread agent([&]()
                          {
            while (auto guard = tickLock.take())
            {
                std::optional<TickGuard> moved(std::move(*guard));
                ++agentTicks;
            } });

        for (int i = 0; i < 3; ++i)
        {
            auto guard = tickLock.take();
            REQUIRE(guard.has_value(), "world tick " << i);
            if (i == 2)
                guard->stop();
        }

        agent.join();
        REQUIRE(agentTicks.load() == 3, "agent ticks " << agentTicks.load());
        std::cout << "[PASS] moved guard\n";
    }
}

int main()
{
    runBarrierReleasesOneLeaderPerCycle();
    runWorldAloneTicks();
    runPartiesStayInLockstep();
    runStopWaitsForAgentsInTick();
    runMovedGuardEndsTickOnce();
    std::cout << "All tick lock tests passed\n";
    return 0;
}
