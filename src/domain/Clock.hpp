/**
 * @file Clock.hpp
 * @brief Injectable time source so windowed computations are reproducible.
 */

#pragma once

#include "domain/Timestamp.hpp"

namespace healthiq::domain {

class Clock {
public:
    virtual ~Clock() = default;
    virtual TimePoint now() const = 0;
};

class SystemClock : public Clock {
public:
    TimePoint now() const override { return std::chrono::system_clock::now(); }
};

/** @brief Always returns the instant it was built with (tests, replays, CLI --now). */
class FixedClock : public Clock {
public:
    explicit FixedClock(TimePoint instant) : m_instant(instant) {}
    TimePoint now() const override { return m_instant; }

private:
    TimePoint m_instant;
};

} // namespace healthiq::domain
