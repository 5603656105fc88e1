#include "BotBody.h"
#include <algorithm>
#include <cmath>
#include <iostream>

namespace
{
    // checks value against range and stores it in field only when allowed
    std::optional<BotError> setChecked(double &field, double value, const ValueRange &range, BotError::Kind errorKind)
    {
        if (!range.contains(value))
            return BotError::badValue(errorKind, value);

        field = value;
        return std::nullopt;
    }
}

BotBody::BotBody(uint64_t id, Vec2 initialPosition, const BotSettings &settings)
    : id_(id), settings_(settings)
{
    state_.position = initialPosition;
    state_.hitPoints = settings_.maxHitPoints;
    state_.shootPower = settings_.maxShootPower;
}

std::optional<BotError> BotBody::applyResponses(const std::vector<BotResponse> &responses)
{
    bool shotThisBatch = false;
    for (const auto &response : responses)
    {
        if (auto error = applyResponse(response, shotThisBatch))
            return error;
    }
    return std::nullopt;
}

std::optional<BotError> BotBody::applyResponse(const BotResponse &response, bool &shotThisBatch)
{
    switch (response.kind)
    {
    case BotResponse::Kind::SetThrust:
        return setChecked(state_.thrust, response.value, settings_.thrustLimits, BotError::Kind::BadThrust);

    case BotResponse::Kind::SetTurnRate:
        return setChecked(state_.turnRate, response.value, settings_.turnRateLimits, BotError::Kind::BadTurnRate);

    case BotResponse::Kind::SetGunTurnRate:
        return setChecked(state_.gunTurnRate, response.value, settings_.gunTurnRateLimits, BotError::Kind::BadGunTurnRate);

    case BotResponse::Kind::SetRadarTurnRate:
        return setChecked(state_.radarTurnRate, response.value, settings_.radarTurnRateLimits, BotError::Kind::BadRadarTurnRate);

    case BotResponse::Kind::Shoot:
        if (!settings_.bulletPowerLimits.contains(response.value))
            return BotError::badValue(BotError::Kind::BadBulletPower, response.value);
        if (shotThisBatch)
            return BotError::badValue(BotError::Kind::TooManyBullets, response.value);

        shotThisBatch = true;

        // not enough power saved up: the shot fizzles
        if (state_.shootPower >= response.value)
        {
            state_.shootPower -= response.value;
            ++shotsFired_;
        }
        return std::nullopt;

    case BotResponse::Kind::DebugPrint:
        std::cout << "Bot " << id_ << ": " << response.text << std::endl;
        return std::nullopt;
    }

    return std::nullopt;
}

void BotBody::integrate(double elapsed)
{
    state_.heading += state_.turnRate * elapsed;
    state_.gunHeading += (state_.gunTurnRate + state_.turnRate) * elapsed;
    state_.radarHeading += (state_.radarTurnRate + state_.turnRate) * elapsed;

    state_.speed += state_.thrust * elapsed;
    state_.speed *= settings_.driveFriction;

    Vec2 direction(std::cos(state_.heading), std::sin(state_.heading));
    state_.position += direction * (state_.speed * elapsed);

    state_.shootPower = std::min(settings_.maxShootPower, state_.shootPower + settings_.shootPowerRegen * elapsed);
}
