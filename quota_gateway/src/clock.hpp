#pragma once

#include "util.hpp"
#include <cstdint>

// Wall-clock source for window and month arithmetic. Injected so tests can
// drive time explicitly.
class Clock {
public:
    virtual ~Clock() = default;
    virtual int64_t now_ms() const = 0;
};

class SystemClock : public Clock {
public:
    int64_t now_ms() const override { return util::current_timestamp_ms(); }
};
