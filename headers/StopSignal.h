#pragma once
#include <atomic>
#include <memory>

// copyable handle for asking the world to stop, checking it never blocks
class StopSignal
{
public:
    StopSignal();

    void request();
    bool isRequested() const;

private:
    std::shared_ptr<std::atomic<bool>> requested_;
};
