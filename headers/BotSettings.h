#pragma once
#include <SFML/System/Vector2.hpp>
#include <chrono>
#include <cstdint>
#include <string>

// inclusive [min, max] range of allowed values
struct ValueRange
{
    double min = 0.0;
    double max = 0.0;

    ValueRange() = default;
    ValueRange(double lo, double hi) : min(lo), max(hi) {}

    double clamp(double value) const
    {
        if (value < min)
            return min;
        if (value > max)
            return max;
        return value;
    }

    // NaN is never contained
    bool contains(double value) const { return min <= value && value <= max; }

    bool operator==(const ValueRange &other) const { return min == other.min && max == other.max; }
    bool operator!=(const ValueRange &other) const { return !(*this == other); }
};

class BotSettings
{
public:
    // world settings
    sf::Vector2<double> worldSize{100.0, 100.0};
    int ticksPerSecond = 60; // simulation rate, not necessarily the rendering rate
    int ticksPerStep = 5;    // ticks between each exchange with a bot's brain
    int numBots = 100;

    // physics
    double driveFriction = 0.95; // multiplicative per tick
    double maxHitPoints = 100.0;
    double maxShootPower = 3.0;
    double shootPowerRegen = 1.0; // per second

    // command limits, commands outside these are rejected
    ValueRange thrustLimits{-10.0, 10.0};
    ValueRange turnRateLimits{-2.0, 2.0};
    ValueRange gunTurnRateLimits{-2.0, 2.0};
    ValueRange radarTurnRateLimits{-2.0, 2.0};
    ValueRange bulletPowerLimits{0.1, 3.0};

    // external bot program, empty = fall back to BOTPRG then to the built in brain
    std::string botProgram;

    BotSettings() = default;

    std::chrono::duration<double> tickDuration() const
    {
        return std::chrono::duration<double>(1.0 / static_cast<double>(ticksPerSecond));
    }

    bool saveToFile(const std::string &filename) const;
    bool loadFromFile(const std::string &filename);

    void validateAndClamp();

    bool operator==(const BotSettings &other) const;
    bool operator!=(const BotSettings &other) const { return !(*this == other); }
};
