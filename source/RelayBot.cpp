#include "RelayBot.h"
#include <utility>

RelayBot::RelayBot(uint64_t id, Vec2 initialPosition, const BotSettings &settings, std::unique_ptr<RelayEndpoint> endpoint)
    : body_(id, initialPosition, settings), relay_(std::move(endpoint)), ticksUntilStep_(settings.ticksPerStep)
{
}

std::optional<BotError> RelayBot::init()
{
    relay_.send(body_.getState(), BotMessage::init(body_.getSettings()));
    return std::nullopt;
}

std::optional<BotError> RelayBot::tick(std::chrono::steady_clock::duration elapsed)
{
    const double seconds = std::chrono::duration<double>(elapsed).count();
    secondsSinceStep_ += seconds;

    if (--ticksUntilStep_ <= 0)
    {
        ticksUntilStep_ = body_.getSettings().ticksPerStep;

        auto responses = relay_.tryReceive();
        if (!responses)
        {
            // a dead relay explains itself better than a timeout
            if (auto failure = relay_.getFailure())
                return BotError::fromProcess(*failure);
            return BotError::slowResponse();
        }

        if (auto error = body_.applyResponses(*responses))
            return error;

        relay_.send(body_.getState(), BotMessage::step(secondsSinceStep_));
        secondsSinceStep_ = 0.0;
    }

    body_.integrate(seconds);
    return std::nullopt;
}

std::optional<BotError> RelayBot::kill()
{
    relay_.send(body_.getState(), BotMessage::kill());
    return std::nullopt;
}
