#pragma once
#include <cstddef>
#include <optional>
#include <string>

// why a relay stopped exchanging messages with a bot's brain
struct ProcessError
{
    enum class Kind
    {
        Serialization,   // outbound message could not be encoded
        Deserialization, // reply line was not a valid response list
        Writing,         // writing to the brain failed
        Reading,         // reading from the brain failed
        Closed,          // the brain's stream ended
        Fault            // an in-process brain threw
    };

    Kind kind = Kind::Closed;
    std::string detail;

    std::string describe() const;
};

// failure of a bot controller, ends that bot's run loop
struct BotError
{
    enum class Kind
    {
        Process,
        SlowResponse,
        BadThrust,
        BadTurnRate,
        BadGunTurnRate,
        BadRadarTurnRate,
        BadBulletPower,
        TooManyBullets
    };

    Kind kind = Kind::SlowResponse;
    double value = 0.0; // the offending command value where there is one
    std::optional<ProcessError> process;

    static BotError fromProcess(ProcessError error);
    static BotError slowResponse() { return {Kind::SlowResponse, 0.0, std::nullopt}; }
    static BotError badValue(Kind kind, double value) { return {kind, value, std::nullopt}; }

    std::string describe() const;
};

// failure of the world loop
struct WorldError
{
    enum class Kind
    {
        Poisoned // an agent's state was left poisoned by a fault
    };

    Kind kind = Kind::Poisoned;
    size_t agentIndex = 0;

    std::string describe() const;
};
