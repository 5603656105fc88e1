#include "BotBrain.h"
#include "WireFormat.h"
#include <exception>
#include <utility>

BotHook::BotHook(const BotSettings &settings, const BotState &state)
    : settings_(settings), state_(state)
{
}

void BotHook::setThrust(double thrust)
{
    state_.thrust = settings_.thrustLimits.clamp(thrust);
    responses_.push_back(BotResponse::setThrust(state_.thrust));
}

void BotHook::setTurnRate(double turnRate)
{
    state_.turnRate = settings_.turnRateLimits.clamp(turnRate);
    responses_.push_back(BotResponse::setTurnRate(state_.turnRate));
}

void BotHook::setGunTurnRate(double gunTurnRate)
{
    state_.gunTurnRate = settings_.gunTurnRateLimits.clamp(gunTurnRate);
    responses_.push_back(BotResponse::setGunTurnRate(state_.gunTurnRate));
}

void BotHook::setRadarTurnRate(double radarTurnRate)
{
    state_.radarTurnRate = settings_.radarTurnRateLimits.clamp(radarTurnRate);
    responses_.push_back(BotResponse::setRadarTurnRate(state_.radarTurnRate));
}

void BotHook::shoot(double power)
{
    responses_.push_back(BotResponse::shoot(settings_.bulletPowerLimits.clamp(power)));
}

void BotHook::debugPrint(const std::string &message)
{
    responses_.push_back(BotResponse::debugPrint(message));
}

std::vector<BotResponse> BotHook::takeResponses()
{
    std::vector<BotResponse> responses;
    responses.swap(responses_);
    return responses;
}

std::vector<BotResponse> dispatchMessage(BotBrain &brain, BotSettings &config,
                                         const BotState &state, const BotMessage &message)
{
    if (message.kind == BotMessage::Kind::Init)
        config = message.config;

    BotHook hook(config, state);

    switch (message.kind)
    {
    case BotMessage::Kind::Init:
        brain.init(hook);
        break;
    case BotMessage::Kind::Step:
        brain.step(hook, message.elapsed);
        break;
    case BotMessage::Kind::Scan:
        brain.scan(hook, message.scanPosition);
        break;
    case BotMessage::Kind::Kill:
        brain.kill(hook);
        break;
    }

    return hook.takeResponses();
}

std::optional<ProcessError> runBrain(BotBrain &brain, std::istream &in, std::ostream &out)
{
    BotSettings config;
    bool alive = true;

    while (alive)
    {
        std::string line;
        if (!std::getline(in, line))
        {
            if (in.eof())
                return ProcessError{ProcessError::Kind::Closed, "end of input before Kill"};
            return ProcessError{ProcessError::Kind::Reading, "stdin"};
        }

        std::pair<BotState, BotMessage> request;
        try
        {
            request = decodeRequest(line);
        }
        catch (const WireFormatError &e)
        {
            return ProcessError{ProcessError::Kind::Deserialization, e.what()};
        }

        alive = request.second.kind != BotMessage::Kind::Kill;
        std::vector<BotResponse> responses = dispatchMessage(brain, config, request.first, request.second);

        std::string reply;
        try
        {
            reply = encodeResponses(responses);
        }
        catch (const WireFormatError &e)
        {
            return ProcessError{ProcessError::Kind::Serialization, e.what()};
        }

        out << reply << '\n';
        out.flush();
        if (!out)
            return ProcessError{ProcessError::Kind::Writing, "stdout"};
    }

    return std::nullopt;
}

BrainEndpoint::BrainEndpoint(std::unique_ptr<BotBrain> brain)
    : brain_(std::move(brain))
{
}

std::optional<ProcessError> BrainEndpoint::exchange(const RelayRequest &request, std::vector<BotResponse> &responses)
{
    if (killed_)
        return ProcessError{ProcessError::Kind::Closed, "brain already killed"};

    try
    {
        responses = dispatchMessage(*brain_, config_, request.state, request.message);
    }
    catch (const std::exception &e)
    {
        return ProcessError{ProcessError::Kind::Fault, e.what()};
    }
    catch (...)
    {
        return ProcessError{ProcessError::Kind::Fault, "unknown fault"};
    }

    killed_ = request.message.kind == BotMessage::Kind::Kill;
    return std::nullopt;
}
