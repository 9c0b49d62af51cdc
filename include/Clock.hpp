#pragma once
#include <atomic>
#include <chrono>
#include <ctime>
#include <string>
#include "Types.hpp"

namespace date
{
class time_zone;
}

// Source of "now" for the cache and the board.
class Clock
{
public:
    virtual ~Clock() = default;

    virtual std::chrono::system_clock::time_point instant() const = 0;
    virtual LocalNow localNow() const = 0;
};

// Wall clock of a named IANA zone. pin() freezes it at a fixed instant for the rest of the run.
class ZonedClock : public Clock
{
public:
    explicit ZonedClock(std::string const& zoneName);

    std::chrono::system_clock::time_point instant() const override;
    LocalNow localNow() const override;

    void pin(std::time_t t);

    static LocalNow toLocal(date::time_zone const* zone, std::chrono::system_clock::time_point tp);

private:
    date::time_zone const* zone;
    std::atomic<bool> pinned{false};
    std::atomic<std::time_t> pinnedAt{0};
};
