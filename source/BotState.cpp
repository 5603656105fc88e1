#include "BotState.h"

bool BotState::operator==(const BotState &other) const
{
    return position == other.position &&
           heading == other.heading &&
           gunHeading == other.gunHeading &&
           radarHeading == other.radarHeading &&
           speed == other.speed &&
           thrust == other.thrust &&
           turnRate == other.turnRate &&
           gunTurnRate == other.gunTurnRate &&
           radarTurnRate == other.radarTurnRate &&
           hitPoints == other.hitPoints &&
           shootPower == other.shootPower;
}

BotMessage BotMessage::init(const BotSettings &config)
{
    BotMessage message;
    message.kind = Kind::Init;
    message.config = config;
    return message;
}

BotMessage BotMessage::step(double elapsed)
{
    BotMessage message;
    message.kind = Kind::Step;
    message.elapsed = elapsed;
    return message;
}

BotMessage BotMessage::scan(Vec2 scanPosition)
{
    BotMessage message;
    message.kind = Kind::Scan;
    message.scanPosition = scanPosition;
    return message;
}

BotMessage BotMessage::kill()
{
    return BotMessage();
}

const char *BotMessage::kindName(Kind kind)
{
    switch (kind)
    {
    case Kind::Init:
        return "Init";
    case Kind::Step:
        return "Step";
    case Kind::Scan:
        return "Scan";
    case Kind::Kill:
        return "Kill";
    default:
        return "Unknown";
    }
}

const char *BotResponse::kindName(Kind kind)
{
    switch (kind)
    {
    case Kind::SetThrust:
        return "SetThrust";
    case Kind::SetTurnRate:
        return "SetTurnRate";
    case Kind::SetGunTurnRate:
        return "SetGunTurnRate";
    case Kind::SetRadarTurnRate:
        return "SetRadarTurnRate";
    case Kind::Shoot:
        return "Shoot";
    case Kind::DebugPrint:
        return "DebugPrint";
    default:
        return "Unknown";
    }
}
