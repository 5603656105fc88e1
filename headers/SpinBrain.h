#pragma once
#include "BotBrain.h"
#include <cstdint>
#include <random>

// circles around and flips between driving forwards and backwards every few steps
class SpinBrain : public BotBrain
{
public:
    explicit SpinBrain(uint32_t seed = std::random_device{}());

    void init(BotHook &hook) override;
    void step(BotHook &hook, double elapsed) override;

    bool isReversing() const { return reversing_; }

private:
    uint32_t nextStepCount();

    std::mt19937 gen_;
    uint32_t stepsUntilFlip_;
    bool reversing_ = false;
};
