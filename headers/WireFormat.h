#pragma once
#include "BotSettings.h"
#include "BotState.h"
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

/**
 * line protocol between the simulator and a bot's brain
 * every line is one JSON value, enums use the externally tagged form:
 *   request:  [state, {"Step":{"elapsed":0.08}}]   or   [state, "Kill"]
 *   response: [{"SetThrust":2.5}, {"DebugPrint":"hello"}]
 */

class WireFormatError : public std::runtime_error
{
public:
    explicit WireFormatError(const std::string &what) : std::runtime_error(what) {}
};

void to_json(nlohmann::json &j, const ValueRange &range);
void from_json(const nlohmann::json &j, ValueRange &range);

void to_json(nlohmann::json &j, const BotSettings &settings);
void from_json(const nlohmann::json &j, BotSettings &settings);

void to_json(nlohmann::json &j, const BotState &state);
void from_json(const nlohmann::json &j, BotState &state);

void to_json(nlohmann::json &j, const BotMessage &message);
void from_json(const nlohmann::json &j, BotMessage &message);

void to_json(nlohmann::json &j, const BotResponse &response);
void from_json(const nlohmann::json &j, BotResponse &response);

// all of these throw WireFormatError, the returned lines carry no trailing newline
std::string encodeRequest(const BotState &state, const BotMessage &message);
std::pair<BotState, BotMessage> decodeRequest(const std::string &line);

std::string encodeResponses(const std::vector<BotResponse> &responses);
std::vector<BotResponse> decodeResponses(const std::string &line);
