#pragma once
#include "BotSettings.h"
#include <SFML/System/Vector2.hpp>
#include <string>
#include <utility>

using Vec2 = sf::Vector2<double>;

// publicly observable state of one bot, also what is sent to its brain every step
struct BotState
{
    Vec2 position{0.0, 0.0}; // origin in the lower left

    // absolute angles in radians, anticlockwise with 0 pointing along +x
    double heading = 0.0;
    double gunHeading = 0.0;
    double radarHeading = 0.0;

    double speed = 0.0;  // units per second along heading
    double thrust = 0.0; // units per second squared

    double turnRate = 0.0;
    double gunTurnRate = 0.0;   // relative to the body
    double radarTurnRate = 0.0; // relative to the body

    double hitPoints = 0.0;
    double shootPower = 0.0; // regenerates over time, spent by shooting

    bool operator==(const BotState &other) const;
    bool operator!=(const BotState &other) const { return !(*this == other); }
};

// event sent to a bot's brain
struct BotMessage
{
    enum class Kind
    {
        Init, // carries the settings
        Step, // carries seconds since the previous step
        Scan, // carries where an enemy was seen
        Kill
    };

    Kind kind = Kind::Kill;
    BotSettings config;
    double elapsed = 0.0;
    Vec2 scanPosition{0.0, 0.0};

    static BotMessage init(const BotSettings &config);
    static BotMessage step(double elapsed);
    static BotMessage scan(Vec2 scanPosition);
    static BotMessage kill();

    static const char *kindName(Kind kind);
};

// command sent back by a bot's brain
struct BotResponse
{
    enum class Kind
    {
        SetThrust,
        SetTurnRate,
        SetGunTurnRate,
        SetRadarTurnRate,
        Shoot,
        DebugPrint
    };

    Kind kind = Kind::DebugPrint;
    double value = 0.0; // unused by DebugPrint
    std::string text;   // only used by DebugPrint

    static BotResponse setThrust(double thrust) { return {Kind::SetThrust, thrust, {}}; }
    static BotResponse setTurnRate(double rate) { return {Kind::SetTurnRate, rate, {}}; }
    static BotResponse setGunTurnRate(double rate) { return {Kind::SetGunTurnRate, rate, {}}; }
    static BotResponse setRadarTurnRate(double rate) { return {Kind::SetRadarTurnRate, rate, {}}; }
    static BotResponse shoot(double power) { return {Kind::Shoot, power, {}}; }
    static BotResponse debugPrint(std::string message) { return {Kind::DebugPrint, 0.0, std::move(message)}; }

    static const char *kindName(Kind kind);

    bool operator==(const BotResponse &other) const
    {
        return kind == other.kind && value == other.value && text == other.text;
    }
};
