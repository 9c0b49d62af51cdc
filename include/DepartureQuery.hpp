#pragma once
#include <cstddef>
#include <string>
#include <vector>
#include "Types.hpp"

struct DepartureLabels
{
    std::string line = "GO";
    std::string headsign = "Union Station";
};

class DepartureQuery
{
public:
    // Next departures from origin to destination leaving at or after nowSec,
    // sorted by departure time and cut to limit. Reads the snapshot only.
    static std::vector<Departure> nextDepartures(FeedSnapshot const& snapshot,
                                                 int nowSec,
                                                 std::size_t limit,
                                                 DepartureLabels const& labels = {});

    // Seconds since midnight as "HH:MM"; hours past 23 are kept ("25:10").
    static std::string formatHhmm(int seconds);
};
