#include "StopSignal.h"

StopSignal::StopSignal()
    : requested_(std::make_shared<std::atomic<bool>>(false))
{
}

void StopSignal::request()
{
    requested_->store(true);
}

bool StopSignal::isRequested() const
{
    return requested_->load();
}
