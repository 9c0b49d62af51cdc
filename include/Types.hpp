#pragma once
#include <array>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

struct Route
{
    std::string shortName;
    std::string longName;
};

struct Trip
{
    std::string serviceId;
    std::string headsign;
    std::string routeId;
};

// calendar.txt row. Dates are YYYYMMDD and compare as text.
struct CalendarRule
{
    std::string serviceId;
    std::string startDate;
    std::string endDate;
    std::array<bool, 7> weekdays{}; // 0 = Monday
};

struct CalendarException
{
    enum class Type { Add = 1, Remove = 2 };

    std::string serviceId;
    std::string date;
    Type type;
};

// One visit of a target stop by a trip.
struct StopVisit
{
    int timeSec;       // may exceed 86400 for service past midnight
    uint32_t sequence;
};

struct StopTimeEntry
{
    std::optional<StopVisit> origin;      // departure at the origin stop
    std::optional<StopVisit> destination; // arrival at the destination stop
};

struct StationPair
{
    std::string originId;
    std::string destinationId;
};

// Wall-clock reading in the board's time zone.
struct LocalNow
{
    std::string date;   // YYYYMMDD
    int weekday;        // 0 = Monday ... 6 = Sunday
    int secondsOfDay;
    std::string hhmm;
};

struct Departure
{
    std::string dep;
    std::string arr;
    std::string line;
    std::string headsign;
    int depSec;
};

// Immutable once built; replaced wholesale by the cache.
struct FeedSnapshot
{
    StationPair stops;
    std::unordered_map<std::string, Route> routes;
    std::unordered_map<std::string, Trip> trips;
    std::unordered_set<std::string> activeServices;
    std::string serviceDate;
    std::unordered_map<std::string, StopTimeEntry> stopTimes;
    std::chrono::system_clock::time_point fetchedAt;
};

// Raw table texts pulled out of the archive; absent tables stay empty.
struct FeedTables
{
    std::optional<std::string> stops;
    std::optional<std::string> routes;
    std::optional<std::string> trips;
    std::optional<std::string> stopTimes;
    std::optional<std::string> calendar;
    std::optional<std::string> calendarDates;
};
