#include "WireFormat.h"

using nlohmann::json;

namespace
{
    json vectorToJson(const Vec2 &v)
    {
        return json{{"x", v.x}, {"y", v.y}};
    }

    Vec2 vectorFromJson(const json &j)
    {
        return Vec2(j.at("x").get<double>(), j.at("y").get<double>());
    }

    // the single key of an externally tagged variant
    const std::string &variantTag(const json &j)
    {
        if (!j.is_object() || j.size() != 1)
            throw WireFormatError("expected an object with exactly one variant tag");
        return j.begin().key();
    }
}

void to_json(json &j, const ValueRange &range)
{
    j = json{{"min", range.min}, {"max", range.max}};
}

void from_json(const json &j, ValueRange &range)
{
    range.min = j.at("min").get<double>();
    range.max = j.at("max").get<double>();
}

void to_json(json &j, const BotSettings &settings)
{
    j = json{
        {"world_size", vectorToJson(settings.worldSize)},
        {"ticks_per_second", settings.ticksPerSecond},
        {"ticks_per_step", settings.ticksPerStep},
        {"drive_friction", settings.driveFriction},
        {"max_hit_points", settings.maxHitPoints},
        {"max_shoot_power", settings.maxShootPower},
        {"shoot_power_regen", settings.shootPowerRegen},
        {"thrust_limits", settings.thrustLimits},
        {"turn_rate_limits", settings.turnRateLimits},
        {"gun_turn_rate_limits", settings.gunTurnRateLimits},
        {"radar_turn_rate_limits", settings.radarTurnRateLimits},
        {"bullet_power_limits", settings.bulletPowerLimits}};
}

void from_json(const json &j, BotSettings &settings)
{
    settings.worldSize = vectorFromJson(j.at("world_size"));
    j.at("ticks_per_second").get_to(settings.ticksPerSecond);
    j.at("ticks_per_step").get_to(settings.ticksPerStep);
    j.at("drive_friction").get_to(settings.driveFriction);
    j.at("max_hit_points").get_to(settings.maxHitPoints);
    j.at("max_shoot_power").get_to(settings.maxShootPower);
    j.at("shoot_power_regen").get_to(settings.shootPowerRegen);
    j.at("thrust_limits").get_to(settings.thrustLimits);
    j.at("turn_rate_limits").get_to(settings.turnRateLimits);
    j.at("gun_turn_rate_limits").get_to(settings.gunTurnRateLimits);
    j.at("radar_turn_rate_limits").get_to(settings.radarTurnRateLimits);
    j.at("bullet_power_limits").get_to(settings.bulletPowerLimits);
}

void to_json(json &j, const BotState &state)
{
    j = json{
        {"pos", vectorToJson(state.position)},
        {"heading", state.heading},
        {"gun_heading", state.gunHeading},
        {"radar_heading", state.radarHeading},
        {"speed", state.speed},
        {"thrust", state.thrust},
        {"turn_rate", state.turnRate},
        {"gun_turn_rate", state.gunTurnRate},
        {"radar_turn_rate", state.radarTurnRate},
        {"hit_points", state.hitPoints},
        {"shoot_power", state.shootPower}};
}

void from_json(const json &j, BotState &state)
{
    state.position = vectorFromJson(j.at("pos"));
    j.at("heading").get_to(state.heading);
    j.at("gun_heading").get_to(state.gunHeading);
    j.at("radar_heading").get_to(state.radarHeading);
    j.at("speed").get_to(state.speed);
    j.at("thrust").get_to(state.thrust);
    j.at("turn_rate").get_to(state.turnRate);
    j.at("gun_turn_rate").get_to(state.gunTurnRate);
    j.at("radar_turn_rate").get_to(state.radarTurnRate);
    j.at("hit_points").get_to(state.hitPoints);
    j.at("shoot_power").get_to(state.shootPower);
}

void to_json(json &j, const BotMessage &message)
{
    switch (message.kind)
    {
    case BotMessage::Kind::Init:
        j = json{{"Init", json{{"config", message.config}}}};
        break;
    case BotMessage::Kind::Step:
        j = json{{"Step", json{{"elapsed", message.elapsed}}}};
        break;
    case BotMessage::Kind::Scan:
        j = json{{"Scan", json{{"scan_pos", vectorToJson(message.scanPosition)}}}};
        break;
    case BotMessage::Kind::Kill:
        j = "Kill"; // unit variant
        break;
    }
}

void from_json(const json &j, BotMessage &message)
{
    if (j.is_string())
    {
        if (j.get<std::string>() != "Kill")
            throw WireFormatError("unknown message " + j.get<std::string>());
        message = BotMessage::kill();
        return;
    }

    const std::string &tag = variantTag(j);
    const json &body = j.at(tag);

    if (tag == "Init")
        message = BotMessage::init(body.at("config").get<BotSettings>());
    else if (tag == "Step")
        message = BotMessage::step(body.at("elapsed").get<double>());
    else if (tag == "Scan")
        message = BotMessage::scan(vectorFromJson(body.at("scan_pos")));
    else
        throw WireFormatError("unknown message " + tag);
}

void to_json(json &j, const BotResponse &response)
{
    if (response.kind == BotResponse::Kind::DebugPrint)
        j = json{{"DebugPrint", response.text}};
    else
        j = json{{BotResponse::kindName(response.kind), response.value}};
}

void from_json(const json &j, BotResponse &response)
{
    const std::string &tag = variantTag(j);
    const json &body = j.at(tag);

    if (tag == "SetThrust")
        response = BotResponse::setThrust(body.get<double>());
    else if (tag == "SetTurnRate")
        response = BotResponse::setTurnRate(body.get<double>());
    else if (tag == "SetGunTurnRate")
        response = BotResponse::setGunTurnRate(body.get<double>());
    else if (tag == "SetRadarTurnRate")
        response = BotResponse::setRadarTurnRate(body.get<double>());
    else if (tag == "Shoot")
        response = BotResponse::shoot(body.get<double>());
    else if (tag == "DebugPrint")
        response = BotResponse::debugPrint(body.get<std::string>());
    else
        throw WireFormatError("unknown response " + tag);
}

std::string encodeRequest(const BotState &state, const BotMessage &message)
{
    try
    {
        return json::array({json(state), json(message)}).dump();
    }
    catch (const json::exception &e)
    {
        throw WireFormatError(e.what());
    }
}

std::pair<BotState, BotMessage> decodeRequest(const std::string &line)
{
    try
    {
        json j = json::parse(line);
        if (!j.is_array() || j.size() != 2)
            throw WireFormatError("expected a [state, message] pair");

        return {j[0].get<BotState>(), j[1].get<BotMessage>()};
    }
    catch (const json::exception &e)
    {
        throw WireFormatError(e.what());
    }
}

std::string encodeResponses(const std::vector<BotResponse> &responses)
{
    try
    {
        return json(responses).dump();
    }
    catch (const json::exception &e)
    {
        throw WireFormatError(e.what());
    }
}

std::vector<BotResponse> decodeResponses(const std::string &line)
{
    try
    {
        json j = json::parse(line);
        if (!j.is_array())
            throw WireFormatError("expected a list of responses");

        return j.get<std::vector<BotResponse>>();
    }
    catch (const json::exception &e)
    {
        throw WireFormatError(e.what());
    }
}
