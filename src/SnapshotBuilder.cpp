#include "SnapshotBuilder.hpp"
#include <iostream>
#include "FeedError.hpp"
#include "Parser.hpp"
#include "ServiceCalendar.hpp"
#include "StopManager.hpp"
#include "StopTimeIndexer.hpp"

std::shared_ptr<FeedSnapshot const> SnapshotBuilder::build(FeedTables const& tables,
                                                           StationNames const& stations,
                                                           LocalNow const& today,
                                                           std::chrono::system_clock::time_point fetchedAt)
{
    if (!tables.stops || !tables.trips || !tables.stopTimes)
    {
        throw FeedError(FeedError::Kind::MissingTable,
                        "Missing required GTFS files in ZIP (stops/trips/stop_times).");
    }

    auto snap = std::make_shared<FeedSnapshot>();

    {
        StopManager stops(*tables.stops);
        snap->stops.originId      = stops.resolve(stations.origin);
        snap->stops.destinationId = stops.resolve(stations.destination);

        std::cout << "[Feed] Origin " << snap->stops.originId << " (" << stops.getName(snap->stops.originId) << "), "
                  << "destination " << snap->stops.destinationId << " (" << stops.getName(snap->stops.destinationId) << ")\n";
    }

    if (tables.routes)
        snap->routes = Parser::readRoutes(*tables.routes);

    snap->trips = Parser::readTrips(*tables.trips);

    std::vector<CalendarRule> rules;
    std::vector<CalendarException> exceptions;
    if (tables.calendar)      rules      = Parser::readCalendar(*tables.calendar);
    if (tables.calendarDates) exceptions = Parser::readCalendarDates(*tables.calendarDates);

    snap->serviceDate    = today.date;
    snap->activeServices = ServiceCalendar::activeServices(rules, exceptions, today.date, today.weekday);

    snap->stopTimes = StopTimeIndexer::build(*tables.stopTimes, snap->stops);
    snap->fetchedAt = fetchedAt;

    std::cout << "[Feed] " << snap->trips.size() << " trips, " << snap->routes.size() << " routes, "
              << snap->activeServices.size() << " services active on " << today.date << "\n";

    return snap;
}
