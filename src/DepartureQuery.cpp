#include "DepartureQuery.hpp"
#include <algorithm>
#include <cstdio>

std::vector<Departure> DepartureQuery::nextDepartures(FeedSnapshot const& snapshot,
                                                      int nowSec,
                                                      std::size_t limit,
                                                      DepartureLabels const& labels)
{
    std::vector<Departure> results;

    for (auto const& [tripId, st] : snapshot.stopTimes)
    {
        if (!st.origin || !st.destination)
            continue;
        if (!(st.origin->sequence < st.destination->sequence))
            continue;

        auto tripIt = snapshot.trips.find(tripId);
        if (tripIt == snapshot.trips.end())
            continue;
        Trip const& trip = tripIt->second;

        if (!snapshot.activeServices.count(trip.serviceId))
            continue;

        int depSec = st.origin->timeSec;
        if (depSec < nowSec)
            continue;

        std::string line = labels.line;
        auto routeIt = snapshot.routes.find(trip.routeId);
        if (routeIt != snapshot.routes.end())
        {
            if (!routeIt->second.shortName.empty())
                line = routeIt->second.shortName;
            else if (!routeIt->second.longName.empty())
                line = routeIt->second.longName;
        }

        results.push_back({formatHhmm(depSec),
                           formatHhmm(st.destination->timeSec),
                           std::move(line),
                           trip.headsign.empty() ? labels.headsign : trip.headsign,
                           depSec});
    }

    // Ties broken by arrival so that the order does not depend on hash order.
    std::sort(results.begin(), results.end(), [](Departure const& a, Departure const& b)
    {
        if (a.depSec != b.depSec)
            return a.depSec < b.depSec;
        if (a.arr != b.arr)
            return a.arr < b.arr;
        return a.line < b.line;
    });

    if (results.size() > limit)
        results.resize(limit);

    return results;
}

std::string DepartureQuery::formatHhmm(int seconds)
{
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%02d:%02d", seconds / 3600, (seconds % 3600) / 60);
    return buf;
}
