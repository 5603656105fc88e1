#pragma once
#include "TickLock.h"
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

/**
 * failure of an agent runner
 * the controller's own error, or StatePoisoned once a fault escaped the controller while its lock was held
 */
template <typename E>
struct RunnerError
{
    enum class Kind
    {
        StatePoisoned,
        Controller
    };

    Kind kind = Kind::StatePoisoned;
    std::optional<E> controllerError;

    static RunnerError poisoned() { return RunnerError{Kind::StatePoisoned, std::nullopt}; }
    static RunnerError controller(E error) { return RunnerError{Kind::Controller, std::move(error)}; }

    bool isPoisoned() const { return kind == Kind::StatePoisoned; }

    std::string describe() const
    {
        if (kind == Kind::StatePoisoned || !controllerError)
            return "state poisoned";
        return controllerError->describe();
    }
};

/**
 * drives one controller through init, one tick per tick lock round, and kill
 *
 * Ctl must provide:
 *   using PublicData = ...;   copyable snapshot type
 *   using Error = ...;        with std::string describe() const
 *   std::optional<Error> init();
 *   std::optional<Error> tick(std::chrono::steady_clock::duration elapsed);
 *   std::optional<Error> kill();
 *   PublicData publicData() const;
 *
 * the controller lives behind a mutex; the world takes it between ticks to copy the public data
 */
template <typename Ctl>
class AgentRunner
{
public:
    using PublicData = typename Ctl::PublicData;
    using Error = RunnerError<typename Ctl::Error>;

    // empty on a clean shutdown
    using Status = std::optional<Error>;

    explicit AgentRunner(Ctl controller)
        : controller_(std::move(controller))
    {
    }

    AgentRunner(const AgentRunner &) = delete;
    AgentRunner &operator=(const AgentRunner &) = delete;

    // runs synchronously until the tick lock stops or the controller fails, call it once
    Status run(TickLock &tickLock)
    {
        if (auto error = withLockedController([](Ctl &ctl)
                                              { return ctl.init(); }))
            return error;

        auto previousTime = std::chrono::steady_clock::now();

        while (true)
        {
            // controller work has to happen while the guard is alive, between the two barriers
            if (auto tickGuard = tickLock.take())
            {
                const auto now = std::chrono::steady_clock::now();
                const auto elapsed = now - previousTime;
                previousTime = now;

                if (auto error = withLockedController([elapsed](Ctl &ctl)
                                                      { return ctl.tick(elapsed); }))
                    return error;
            }
            else
            {
                return withLockedController([](Ctl &ctl)
                                            { return ctl.kill(); });
            }
        }
    }

    // empty when the state is poisoned
    std::optional<PublicData> publicData() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (poisoned_)
            return std::nullopt;
        return controller_.publicData();
    }

    // read only access to the controller under its lock, empty when poisoned
    template <typename Function>
    auto withController(Function &&func) const -> std::optional<decltype(func(std::declval<const Ctl &>()))>
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (poisoned_)
            return std::nullopt;
        return func(static_cast<const Ctl &>(controller_));
    }

    bool isPoisoned() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return poisoned_;
    }

private:
    // calls func with the lock held; an exception escaping it poisons the state and keeps propagating
    template <typename Function>
    Status withLockedController(Function &&func)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (poisoned_)
            return Error::poisoned();

        std::optional<typename Ctl::Error> result;
        try
        {
            result = func(controller_);
        }
        catch (...)
        {
            poisoned_ = true;
            throw;
        }

        if (result)
            return Error::controller(std::move(*result));
        return std::nullopt;
    }

    mutable std::mutex mutex_;
    Ctl controller_;
    bool poisoned_ = false;
};
