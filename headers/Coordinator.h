#pragma once
#include "ConcurrentQueue.h"
#include <cstddef>
#include <exception>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

/**
 * what a supervised thread ended with: either its return value or the exception that escaped it
 */
template <typename T>
class TaskOutcome
{
public:
    static TaskOutcome success(T value)
    {
        TaskOutcome outcome;
        outcome.value_.emplace(std::move(value));
        return outcome;
    }

    static TaskOutcome failure(std::exception_ptr fault)
    {
        TaskOutcome outcome;
        outcome.fault_ = std::move(fault);
        return outcome;
    }

    bool isFault() const { return !value_.has_value(); }

    const T &value() const
    {
        if (!value_)
            throw std::logic_error("TaskOutcome holds a fault, not a value");
        return *value_;
    }

    T &value()
    {
        if (!value_)
            throw std::logic_error("TaskOutcome holds a fault, not a value");
        return *value_;
    }

    std::exception_ptr fault() const { return fault_; }

    // re-raises the captured fault, does nothing for a successful outcome
    void rethrow() const
    {
        if (fault_)
            std::rethrow_exception(fault_);
    }

    std::string faultMessage() const
    {
        if (!fault_)
            return std::string();

        try
        {
            std::rethrow_exception(fault_);
        }
        catch (const std::exception &e)
        {
            return e.what();
        }
        catch (...)
        {
            return "unknown fault";
        }
    }

private:
    TaskOutcome() = default;

    std::optional<T> value_;
    std::exception_ptr fault_;
};

/**
 * supervisor for a growing set of threads that all produce a T
 * exceptions escaping a spawned closure are captured as faults instead of terminating the process,
 * escalation is left to whoever reads the outcomes
 */
template <typename T>
class Coordinator
{
public:
    Coordinator()
        : completions_(std::make_shared<ConcurrentQueue<Completion>>())
    {
    }

    Coordinator(const Coordinator &) = delete;
    Coordinator &operator=(const Coordinator &) = delete;
    Coordinator(Coordinator &&) = default;
    Coordinator &operator=(Coordinator &&) = default;

    // starts the closure on a new thread immediately, outcomes keep the spawn index
    template <typename Function>
    void spawn(Function &&func)
    {
        const size_t id = count_;
        auto completions = completions_;

        std::thread([completions, id, task = std::forward<Function>(func)]() mutable
                    {
            try
            {
                completions->push(Completion{id, TaskOutcome<T>::success(task())});
            }
            catch (...)
            {
                completions->push(Completion{id, TaskOutcome<T>::failure(std::current_exception())});
            } })
            .detach();

        ++count_;
        ++countActive_;
    }

    // blocks until any running thread finishes and returns its outcome, the others keep running.
    // returns nothing straight away when no thread is left running
    std::optional<TaskOutcome<T>> waitNext()
    {
        if (countActive_ == 0)
            return std::nullopt;

        --countActive_;
        auto completion = completions_->pop();
        return std::move(completion->outcome);
    }

    // blocks until every running thread has finished, outcomes are indexed by spawn order.
    // entries already handed out by waitNext() are left empty
    std::vector<std::optional<TaskOutcome<T>>> waitAll()
    {
        std::vector<std::optional<TaskOutcome<T>>> outcomes(count_);

        while (countActive_ > 0)
        {
            --countActive_;
            auto completion = completions_->pop();
            outcomes[completion->id].emplace(std::move(completion->outcome));
        }

        return outcomes;
    }

    size_t getSpawnedCount() const { return count_; }
    size_t getActiveCount() const { return countActive_; }

private:
    struct Completion
    {
        size_t id;
        TaskOutcome<T> outcome;
    };

    std::shared_ptr<ConcurrentQueue<Completion>> completions_;
    size_t count_ = 0;
    size_t countActive_ = 0;
};
