#pragma once
#include "BotBody.h"
#include "BotErrors.h"
#include "BotSettings.h"
#include "BotState.h"
#include "MailboxRelay.h"
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>

/**
 * bot controller whose decisions come through a mailbox relay
 * backed either by an external program (StreamEndpoint) or by an in process brain (BrainEndpoint).
 * the relay is polled once every ticksPerStep ticks: a missing reply is an error rather than a wait,
 * so one slow brain can never stall the simulation
 */
class RelayBot
{
public:
    using PublicData = BotState;
    using Error = BotError;

    RelayBot(uint64_t id, Vec2 initialPosition, const BotSettings &settings, std::unique_ptr<RelayEndpoint> endpoint);

    std::optional<BotError> init();
    std::optional<BotError> tick(std::chrono::steady_clock::duration elapsed);
    std::optional<BotError> kill();

    BotState publicData() const { return body_.getState(); }

    const BotBody &getBody() const { return body_; }
    const MailboxRelay &getRelay() const { return relay_; }

private:
    BotBody body_;
    MailboxRelay relay_;

    int ticksUntilStep_;
    double secondsSinceStep_ = 0.0;
};
