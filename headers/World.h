#pragma once
#include "AgentRunner.h"
#include "BotErrors.h"
#include "BotSettings.h"
#include "SnapshotBoard.h"
#include "StopSignal.h"
#include "TickLock.h"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <thread>
#include <utility>
#include <vector>

/**
 * owns every agent and paces the simulation
 * each round the world copies all public snapshots into the board (outside of any tick),
 * then takes part in the tick and sleeps away whatever is left of the tick budget.
 * every agent has to be running AgentRunner::run() with getTickLock() on its own thread
 */
template <typename Ctl>
class World
{
public:
    using PublicData = typename Ctl::PublicData;
    using Runner = AgentRunner<Ctl>;

    World(const BotSettings &settings, std::vector<Ctl> controllers)
        : settings_(settings)
    {
        // a zero or negative tick rate has no tick duration
        settings_.validateAndClamp();

        agents_.reserve(controllers.size());
        for (auto &controller : controllers)
            agents_.push_back(std::make_shared<Runner>(std::move(controller)));

        tickLock_ = std::make_shared<TickLock>(agents_.size());

        std::vector<PublicData> initial;
        initial.reserve(agents_.size());
        for (const auto &agent : agents_)
        {
            if (auto data = agent->publicData())
                initial.push_back(std::move(*data));
        }
        snapshots_ = std::make_shared<SnapshotBoard<PublicData>>(std::move(initial));

        std::cout << "World initialized:" << std::endl;
        std::cout << "  Agents: " << agents_.size() << std::endl;
        std::cout << "  Tick rate: " << settings_.ticksPerSecond << " per second" << std::endl;
    }

    World(const World &) = delete;
    World &operator=(const World &) = delete;

    // runs until a stop request has gone through a full tick, or an agent turns out poisoned
    std::optional<WorldError> run()
    {
        const auto tickDuration = std::chrono::duration_cast<std::chrono::steady_clock::duration>(settings_.tickDuration());
        auto nextTickTime = std::chrono::steady_clock::now() + tickDuration;

        while (true)
        {
            // safe: no agent is inside a tick here
            if (auto error = publishSnapshots())
                return error;

            auto tickGuard = tickLock_->take();
            if (!tickGuard)
                return std::nullopt;

            ++ticksDone_;

            if (stopSignal_.isRequested())
                tickGuard->stop();

            // lost frames are never caught up on
            const auto now = std::chrono::steady_clock::now();
            if (now < nextTickTime)
                std::this_thread::sleep_for(nextTickTime - now);
            nextTickTime += tickDuration;
        }
    }

    const std::vector<std::shared_ptr<Runner>> &getAgents() const { return agents_; }
    std::shared_ptr<TickLock> getTickLock() const { return tickLock_; }
    std::shared_ptr<SnapshotBoard<PublicData>> getSnapshots() const { return snapshots_; }
    StopSignal getStopSignal() const { return stopSignal_; }
    const BotSettings &getSettings() const { return settings_; }

    uint64_t getTicksDone() const { return ticksDone_.load(); }

private:
    std::optional<WorldError> publishSnapshots()
    {
        std::vector<PublicData> batch;
        batch.reserve(agents_.size());

        for (size_t i = 0; i < agents_.size(); ++i)
        {
            auto data = agents_[i]->publicData();
            if (!data)
                return WorldError{WorldError::Kind::Poisoned, i};
            batch.push_back(std::move(*data));
        }

        snapshots_->publish(std::move(batch));
        return std::nullopt;
    }

    BotSettings settings_;
    std::vector<std::shared_ptr<Runner>> agents_;
    std::shared_ptr<TickLock> tickLock_;
    std::shared_ptr<SnapshotBoard<PublicData>> snapshots_;
    StopSignal stopSignal_;
    std::atomic<uint64_t> ticksDone_{0};
};
