#include "BotBrain.h"
#include "SpinBrain.h"
#include "TestHarness.h"
#include "WireFormat.h"

#include <sstream>
#include <string>
#include <vector>

namespace
{
    static std::vector<std::string> splitLines(const std::string &text)
    {
        std::vector<std::string> lines;
        std::istringstream in(text);
        std::string line;
        while (std::getline(in, line))
            lines.push_back(line);
        return lines;
    }

    static void runHookClampsCommands()
    {
        const BotSettings settings;
        BotState state;
        state.heading = 1.0;
        state.gunHeading = 1.5;
        state.radarHeading = 0.25;

        BotHook hook(settings, state);
        requireClose("relative gun", hook.getRelativeGunHeading(), 0.5, 1e-12);
        requireClose("relative radar", hook.getRelativeRadarHeading(), -0.75, 1e-12);

        hook.setThrust(50.0);
        hook.setTurnRate(-50.0);
        hook.setGunTurnRate(1.0);
        hook.setRadarTurnRate(9.0);
        hook.shoot(0.0);
        hook.debugPrint("ready");

        const std::vector<BotResponse> expected = {
            BotResponse::setThrust(settings.thrustLimits.max),
            BotResponse::setTurnRate(settings.turnRateLimits.min),
            BotResponse::setGunTurnRate(1.0),
            BotResponse::setRadarTurnRate(settings.radarTurnRateLimits.max),
            BotResponse::shoot(settings.bulletPowerLimits.min),
            BotResponse::debugPrint("ready"),
        };
        REQUIRE(hook.getResponses() == expected, "recorded commands differ");
        REQUIRE(hook.getState().thrust == settings.thrustLimits.max, "hook state follows the commands");
        REQUIRE(hook.takeResponses().size() == expected.size(), "take returns everything");
        REQUIRE(hook.getResponses().empty(), "take empties the hook");
        std::cout << "[PASS] hook clamps\n";
    }

    // records what it was called with
    struct RecordingBrain : public BotBrain
    {
        void init(BotHook &hook) override
        {
            initTicksPerStep = hook.getSettings().ticksPerStep;
            hook.debugPrint("init");
        }
        void step(BotHook &hook, double elapsed) override
        {
            steps.push_back(elapsed);
            hook.setThrust(elapsed);
        }
        void scan(BotHook &hook, const Vec2 &scanPosition) override
        {
            scans.push_back(scanPosition);
            hook.shoot(1.0);
        }
        void kill(const BotHook &) override { ++kills; }

        int initTicksPerStep = 0;
        std::vector<double> steps;
        std::vector<Vec2> scans;
        int kills = 0;
    };

    static void runBrainAnswersEveryMessage()
    {
        BotSettings config;
        config.ticksPerStep = 9;
        const BotState state;

        std::ostringstream request;
        request << encodeRequest(state, BotMessage::init(config)) << "\n"
                << encodeRequest(state, BotMessage::step(0.5)) << "\n"
                << encodeRequest(state, BotMessage::scan(Vec2(4.0, 2.0))) << "\n"
                << encodeRequest(state, BotMessage::kill()) << "\n"
                << encodeRequest(state, BotMessage::step(0.75)) << "\n";

        std::istringstream in(request.str());
        std::ostringstream out;
        RecordingBrain brain;
        auto error = runBrain(brain, in, out);
        REQUIRE(!error.has_value(), "runBrain failed: " << error->describe());

        auto lines = splitLines(out.str());
        REQUIRE(lines.size() == 4, "expected one reply per message up to Kill, got " << lines.size());
        REQUIRE(decodeResponses(lines[0]) == std::vector<BotResponse>{BotResponse::debugPrint("init")}, "init reply");
        REQUIRE(decodeResponses(lines[1]) == std::vector<BotResponse>{BotResponse::setThrust(0.5)}, "step reply");
        REQUIRE(decodeResponses(lines[2]) == std::vector<BotResponse>{BotResponse::shoot(1.0)}, "scan reply");
        REQUIRE(decodeResponses(lines[3]).empty(), "kill reply");

        REQUIRE(brain.initTicksPerStep == 9, "init should see the sent config");
        REQUIRE(brain.steps.size() == 1 && brain.steps[0] == 0.5, "one step before Kill");
        REQUIRE(brain.scans.size() == 1 && brain.scans[0] == Vec2(4.0, 2.0), "scan position");
        REQUIRE(brain.kills == 1, "kill count");
        std::cout << "[PASS] brain answers\n";
    }

    static void runBrainInputErrors()
    {
        {
            std::istringstream in(encodeRequest(BotState(), BotMessage::step(0.1)) + "\n");
            std::ostringstream out;
            RecordingBrain brain;
            auto error = runBrain(brain, in, out);
            REQUIRE(error && error->kind == ProcessError::Kind::Closed, "end of input before Kill");
            REQUIRE(splitLines(out.str()).size() == 1, "the step is still answered");
        }
        {
            std::istringstream in("{broken\n");
            std::ostringstream out;
            RecordingBrain brain;
            auto error = runBrain(brain, in, out);
            REQUIRE(error && error->kind == ProcessError::Kind::Deserialization, "garbage input");
            REQUIRE(out.str().empty(), "nothing answered");
        }
        std::cout << "[PASS] brain input errors\n";
    }

    static void runSpinBrainFlips()
    {
        SpinBrain brain(7);
        BotSettings config;
        const BotState state;

        auto initReply = dispatchMessage(brain, config, state, BotMessage::init(config));
        REQUIRE(initReply.size() == 3, "init reply size");
        REQUIRE(!brain.isReversing(), "starts driving forwards");

        int stepsUntilFlip = 0;
        for (int i = 1; i <= 40 && !brain.isReversing(); ++i)
        {
            auto reply = dispatchMessage(brain, config, state, BotMessage::step(0.1));
            if (brain.isReversing())
            {
                stepsUntilFlip = i;
                REQUIRE(reply == std::vector<BotResponse>{BotResponse::setThrust(config.thrustLimits.min)}, "flip reply");
            }
            else
            {
                REQUIRE(reply.empty(), "no command between flips");
            }
        }
        REQUIRE(stepsUntilFlip >= 16 && stepsUntilFlip <= 35, "flip after " << stepsUntilFlip << " steps");
        std::cout << "[PASS] spin brain\n";
    }
}

int main()
{
    runHookClampsCommands();
    runBrainAnswersEveryMessage();
    runBrainInputErrors();
    runSpinBrainFlips();
    std::cout << "All bot brain tests passed\n";
    return 0;
}
