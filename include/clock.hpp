#pragma once

#include <cstdint>
#include <memory>

namespace lf {

// Seconds since the Unix epoch.
using Timestamp = std::uint64_t;

constexpr Timestamp kHour = 3600;
constexpr Timestamp kDay = 24 * kHour;
// Upper bound for configured durations; keeps deadline arithmetic far from overflow.
constexpr Timestamp kMaxDuration = 100 * 365 * kDay;

class Clock {
public:
    virtual ~Clock() = default;
    virtual Timestamp now() const = 0;
};

class SystemClock : public Clock {
public:
    Timestamp now() const override;
};

// Time only moves when the driver says so; tests and the console use it to
// step through round deadlines.
class ManualClock : public Clock {
public:
    explicit ManualClock(Timestamp start = 0) : now_(start) {}

    Timestamp now() const override { return now_; }
    void set(Timestamp value);
    void advance(Timestamp seconds);

private:
    Timestamp now_;
};

using ClockPtr = std::shared_ptr<Clock>;

} // namespace lf
