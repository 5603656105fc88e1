#include "BotErrors.h"
#include <sstream>
#include <utility>

std::string ProcessError::describe() const
{
    std::string prefix;
    switch (kind)
    {
    case Kind::Serialization:
        prefix = "could not serialize message";
        break;
    case Kind::Deserialization:
        prefix = "could not deserialize responses";
        break;
    case Kind::Writing:
        prefix = "could not write to bot";
        break;
    case Kind::Reading:
        prefix = "could not read from bot";
        break;
    case Kind::Closed:
        prefix = "bot stream closed";
        break;
    case Kind::Fault:
        prefix = "bot brain faulted";
        break;
    }

    return detail.empty() ? prefix : prefix + ": " + detail;
}

BotError BotError::fromProcess(ProcessError error)
{
    BotError botError;
    botError.kind = Kind::Process;
    botError.process = std::move(error);
    return botError;
}

std::string BotError::describe() const
{
    std::ostringstream oss;
    switch (kind)
    {
    case Kind::Process:
        oss << "process error: " << (process ? process->describe() : std::string("unknown"));
        break;
    case Kind::SlowResponse:
        oss << "bot did not respond in time";
        break;
    case Kind::BadThrust:
        oss << "bad thrust value " << value;
        break;
    case Kind::BadTurnRate:
        oss << "bad turn rate value " << value;
        break;
    case Kind::BadGunTurnRate:
        oss << "bad gun turn rate value " << value;
        break;
    case Kind::BadRadarTurnRate:
        oss << "bad radar turn rate value " << value;
        break;
    case Kind::BadBulletPower:
        oss << "bad bullet power value " << value;
        break;
    case Kind::TooManyBullets:
        oss << "too many bullets in one frame";
        break;
    }
    return oss.str();
}

std::string WorldError::describe() const
{
    std::ostringstream oss;
    switch (kind)
    {
    case Kind::Poisoned:
        oss << "state of agent " << agentIndex << " is poisoned";
        break;
    }
    return oss.str();
}
