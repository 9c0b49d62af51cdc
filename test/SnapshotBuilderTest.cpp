#include "gtest/gtest.h"

#include "DepartureQuery.hpp"
#include "FeedError.hpp"
#include "SnapshotBuilder.hpp"
#include "TestFeed.hpp"

namespace
{
const StationNames kStations{"bloor", "union station"};

FeedError::Kind buildFailure(FeedTables const& tables, StationNames const& stations = kStations)
{
    try
    {
        (void)SnapshotBuilder::build(tables, stations, testfeed::monday(0), {});
    }
    catch (FeedError const& e)
    {
        return e.kind();
    }
    throw std::logic_error("build did not fail");
}
}

TEST(SnapshotBuilder, BuildsCompleteSnapshot)
{
    auto fetchedAt = std::chrono::system_clock::time_point{std::chrono::seconds(1757937600)};
    auto snap = SnapshotBuilder::build(testfeed::tables(), kStations, testfeed::monday(8 * 3600), fetchedAt);

    ASSERT_TRUE(snap);
    EXPECT_EQ("BL", snap->stops.originId);
    EXPECT_EQ("UN", snap->stops.destinationId);
    EXPECT_EQ("20250915", snap->serviceDate);
    EXPECT_EQ(fetchedAt, snap->fetchedAt);
    EXPECT_EQ(6u, snap->trips.size());
    EXPECT_EQ(3u, snap->routes.size());
    EXPECT_EQ((std::unordered_set<std::string>{"S1"}), snap->activeServices);
    EXPECT_EQ(6u, snap->stopTimes.size());
}

TEST(SnapshotBuilder, EndToEndBoard)
{
    auto snap = SnapshotBuilder::build(testfeed::tables(), kStations, testfeed::monday(8 * 3600), {});
    auto out = DepartureQuery::nextDepartures(*snap, 8 * 3600, 3);

    ASSERT_EQ(3u, out.size());
    EXPECT_EQ("08:15", out[0].dep);
    EXPECT_EQ("08:42", out[0].arr);
    EXPECT_EQ("KI", out[0].line);

    EXPECT_EQ("09:01", out[1].dep);
    EXPECT_EQ("Lakeshore West", out[1].line);
    EXPECT_EQ("Union Station", out[1].headsign);

    EXPECT_EQ("25:10", out[2].dep);
    EXPECT_EQ("GO", out[2].line);
    EXPECT_EQ("Union, Late", out[2].headsign);
}

TEST(SnapshotBuilder, StationMatchIsCaseInsensitive)
{
    auto snap = SnapshotBuilder::build(testfeed::tables(), {"BLOOR", "Union"}, testfeed::monday(0), {});
    EXPECT_EQ("BL", snap->stops.originId);
    EXPECT_EQ("UN", snap->stops.destinationId);
}

TEST(SnapshotBuilder, OptionalTablesMayBeAbsent)
{
    FeedTables tables = testfeed::tables();
    tables.routes.reset();
    tables.calendar.reset();
    tables.calendarDates.reset();

    auto snap = SnapshotBuilder::build(tables, kStations, testfeed::monday(0), {});
    EXPECT_TRUE(snap->routes.empty());
    EXPECT_TRUE(snap->activeServices.empty());
    EXPECT_TRUE(DepartureQuery::nextDepartures(*snap, 0, 3).empty());
}

TEST(SnapshotBuilder, MandatoryTablesRequired)
{
    FeedTables noStops = testfeed::tables();
    noStops.stops.reset();
    EXPECT_EQ(FeedError::Kind::MissingTable, buildFailure(noStops));

    FeedTables noTrips = testfeed::tables();
    noTrips.trips.reset();
    EXPECT_EQ(FeedError::Kind::MissingTable, buildFailure(noTrips));

    FeedTables noStopTimes = testfeed::tables();
    noStopTimes.stopTimes.reset();
    EXPECT_EQ(FeedError::Kind::MissingTable, buildFailure(noStopTimes));
}

TEST(SnapshotBuilder, UnknownStationFails)
{
    EXPECT_EQ(FeedError::Kind::UnresolvedStation, buildFailure(testfeed::tables(), {"bloor", "oshawa"}));
    EXPECT_EQ(FeedError::Kind::UnresolvedStation, buildFailure(testfeed::tables(), {"milton", "union"}));
}
