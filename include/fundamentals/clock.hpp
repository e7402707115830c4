#pragma once
#include <chrono>

namespace clk
{

using time_point = std::chrono::system_clock::time_point;

// Wall clock seam. Lockout windows are wall-clock based so they survive
// process restarts; tests substitute a manually advanced clock.
class Clock
{
public:
    virtual ~Clock() = default;
    [[nodiscard]] virtual time_point now() const = 0;
};

class SystemClock final : public Clock
{
public:
    [[nodiscard]] time_point now() const override { return std::chrono::system_clock::now(); }
};

} // namespace clk
