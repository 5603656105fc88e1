#pragma once
#include "BotErrors.h"
#include "BotSettings.h"
#include "BotState.h"
#include <cstdint>
#include <optional>
#include <vector>

/**
 * physics state of one bot
 * commands coming back from a brain are range checked here before they touch the state,
 * integrate() advances the state by one tick
 */
class BotBody
{
public:
    BotBody(uint64_t id, Vec2 initialPosition, const BotSettings &settings);

    // applies commands in order and stops at the first rejected one,
    // the rejected command leaves its field untouched (earlier commands stay applied)
    std::optional<BotError> applyResponses(const std::vector<BotResponse> &responses);

    void integrate(double elapsed);

    const BotState &getState() const { return state_; }
    const BotSettings &getSettings() const { return settings_; }
    uint64_t getId() const { return id_; }
    uint64_t getShotsFired() const { return shotsFired_; }

private:
    std::optional<BotError> applyResponse(const BotResponse &response, bool &shotThisBatch);

    uint64_t id_;
    BotSettings settings_;
    BotState state_;
    uint64_t shotsFired_ = 0;
};
