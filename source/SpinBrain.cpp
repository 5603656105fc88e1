#include "SpinBrain.h"

SpinBrain::SpinBrain(uint32_t seed)
    : gen_(seed)
{
    stepsUntilFlip_ = nextStepCount();
}

uint32_t SpinBrain::nextStepCount()
{
    std::uniform_int_distribution<uint32_t> dist(16, 35);
    return dist(gen_);
}

void SpinBrain::init(BotHook &hook)
{
    // asks for more than allowed, the hook clamps to the limits
    hook.setTurnRate(10.0);
    hook.setGunTurnRate(-10.0);
    hook.setThrust(10.0);
}

void SpinBrain::step(BotHook &hook, double elapsed)
{
    (void)elapsed;

    if (--stepsUntilFlip_ > 0)
        return;

    stepsUntilFlip_ = nextStepCount();
    reversing_ = !reversing_;
    hook.setThrust(reversing_ ? -10.0 : 10.0);
}
