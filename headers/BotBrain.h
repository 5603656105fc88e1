#pragma once
#include "BotErrors.h"
#include "BotSettings.h"
#include "BotState.h"
#include "MailboxRelay.h"
#include <istream>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

/**
 * what a brain sees and can do during one callback
 * setters clamp to the configured limits before recording the command, so a
 * well behaved brain never sends anything the simulator would reject
 */
class BotHook
{
public:
    BotHook(const BotSettings &settings, const BotState &state);

    const BotSettings &getSettings() const { return settings_; }
    const BotState &getState() const { return state_; }

    // relative to the body
    double getRelativeGunHeading() const { return state_.gunHeading - state_.heading; }
    double getRelativeRadarHeading() const { return state_.radarHeading - state_.heading; }

    void setThrust(double thrust);
    void setTurnRate(double turnRate);
    void setGunTurnRate(double gunTurnRate);
    void setRadarTurnRate(double radarTurnRate);

    // only one shot per step is accepted by the simulator
    void shoot(double power);

    void debugPrint(const std::string &message);

    const std::vector<BotResponse> &getResponses() const { return responses_; }
    std::vector<BotResponse> takeResponses();

private:
    BotSettings settings_;
    BotState state_;
    std::vector<BotResponse> responses_;
};

// decision logic of one bot, every callback is optional
class BotBrain
{
public:
    virtual ~BotBrain() = default;

    // once, before the first step
    virtual void init(BotHook &hook) { (void)hook; }

    // every few ticks, elapsed is the time in seconds since the previous step
    virtual void step(BotHook &hook, double elapsed)
    {
        (void)hook;
        (void)elapsed;
    }

    virtual void scan(BotHook &hook, const Vec2 &scanPosition)
    {
        (void)hook;
        (void)scanPosition;
    }

    // the bot is about to die or the simulation is over, nothing can be changed any more
    virtual void kill(const BotHook &hook) { (void)hook; }
};

// runs one message through a brain and returns the commands it issued.
// config is updated by Init messages and passed to every later callback
std::vector<BotResponse> dispatchMessage(BotBrain &brain, BotSettings &config,
                                         const BotState &state, const BotMessage &message);

// brain side of the line protocol, used by external bot programs.
// answers every message with one response line and returns after Kill
std::optional<ProcessError> runBrain(BotBrain &brain, std::istream &in, std::ostream &out);

// runs a brain in process on the relay thread, the in process backend for the same controller
class BrainEndpoint : public RelayEndpoint
{
public:
    explicit BrainEndpoint(std::unique_ptr<BotBrain> brain);

    std::optional<ProcessError> exchange(const RelayRequest &request, std::vector<BotResponse> &responses) override;

private:
    std::unique_ptr<BotBrain> brain_;
    BotSettings config_;
    bool killed_ = false;
};
