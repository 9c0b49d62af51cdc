#include "gtest/gtest.h"

#include "DepartureQuery.hpp"

namespace
{
constexpr int at(int h, int m) { return h * 3600 + m * 60; }

// Trip T1 runs Bloor (seq 3, 08:15) to Union (seq 7, 08:42) on S1.
FeedSnapshot scenario()
{
    FeedSnapshot snap;
    snap.stops = {"BL", "UN"};
    snap.serviceDate = "20250915";
    snap.routes["KI"] = Route{"KI", "Kitchener"};
    snap.trips["T1"] = Trip{"S1", "Union Station", "KI"};
    snap.activeServices = {"S1"};
    snap.stopTimes["T1"] = StopTimeEntry{StopVisit{at(8, 15), 3}, StopVisit{at(8, 42), 7}};
    return snap;
}
}

TEST(DepartureQuery, UpcomingTripIsListed)
{
    auto out = DepartureQuery::nextDepartures(scenario(), at(8, 0), 3);
    ASSERT_EQ(1u, out.size());
    EXPECT_EQ("08:15", out[0].dep);
    EXPECT_EQ("08:42", out[0].arr);
    EXPECT_EQ("KI", out[0].line);
    EXPECT_EQ("Union Station", out[0].headsign);
}

TEST(DepartureQuery, DepartedTripIsExcluded)
{
    EXPECT_TRUE(DepartureQuery::nextDepartures(scenario(), at(8, 20), 3).empty());
}

TEST(DepartureQuery, DepartureAtCurrentSecondIsKept)
{
    EXPECT_EQ(1u, DepartureQuery::nextDepartures(scenario(), at(8, 15), 3).size());
}

TEST(DepartureQuery, InactiveServiceIsExcluded)
{
    auto snap = scenario();
    snap.activeServices.clear();
    EXPECT_TRUE(DepartureQuery::nextDepartures(snap, 0, 3).empty());
}

TEST(DepartureQuery, WrongDirectionIsExcluded)
{
    auto snap = scenario();
    snap.stopTimes["T1"] = StopTimeEntry{StopVisit{at(8, 15), 5}, StopVisit{at(8, 42), 2}};
    EXPECT_TRUE(DepartureQuery::nextDepartures(snap, 0, 3).empty());

    snap.stopTimes["T1"] = StopTimeEntry{StopVisit{at(8, 15), 4}, StopVisit{at(8, 42), 4}};
    EXPECT_TRUE(DepartureQuery::nextDepartures(snap, 0, 3).empty());
}

TEST(DepartureQuery, HalfIndexedTripIsExcluded)
{
    auto snap = scenario();
    snap.stopTimes["T1"].destination.reset();
    EXPECT_TRUE(DepartureQuery::nextDepartures(snap, 0, 3).empty());
}

TEST(DepartureQuery, UnknownTripIsExcluded)
{
    auto snap = scenario();
    snap.trips.clear();
    EXPECT_TRUE(DepartureQuery::nextDepartures(snap, 0, 3).empty());
}

TEST(DepartureQuery, PastMidnightServiceComparesWithoutWrapping)
{
    auto snap = scenario();
    snap.stopTimes["T1"] = StopTimeEntry{StopVisit{at(25, 10), 3}, StopVisit{at(25, 40), 7}};

    auto late = DepartureQuery::nextDepartures(snap, at(0, 5), 3);
    ASSERT_EQ(1u, late.size());
    EXPECT_EQ("25:10", late[0].dep);
    EXPECT_EQ("25:40", late[0].arr);

    EXPECT_EQ(1u, DepartureQuery::nextDepartures(snap, at(23, 59), 3).size());
    EXPECT_TRUE(DepartureQuery::nextDepartures(snap, at(25, 11), 3).empty());
}

TEST(DepartureQuery, LineAndHeadsignFallbacks)
{
    auto snap = scenario();
    snap.trips["T2"] = Trip{"S1", "", "LW"};
    snap.trips["T3"] = Trip{"S1", "Aldershot", "NONE"};
    snap.routes["LW"] = Route{"", "Lakeshore West"};
    snap.stopTimes["T2"] = StopTimeEntry{StopVisit{at(9, 0), 1}, StopVisit{at(9, 30), 2}};
    snap.stopTimes["T3"] = StopTimeEntry{StopVisit{at(10, 0), 1}, StopVisit{at(10, 30), 2}};

    DepartureLabels labels{"GO", "Union Station"};
    auto out = DepartureQuery::nextDepartures(snap, at(8, 30), 3, labels);
    ASSERT_EQ(2u, out.size());
    EXPECT_EQ("Lakeshore West", out[0].line);
    EXPECT_EQ("Union Station", out[0].headsign);
    EXPECT_EQ("GO", out[1].line);
    EXPECT_EQ("Aldershot", out[1].headsign);
}

TEST(DepartureQuery, SortedAndTruncated)
{
    FeedSnapshot snap = scenario();
    snap.stopTimes.clear();
    snap.trips.clear();
    int minutes[] = {50, 5, 40, 20, 30};
    for (int i = 0; i < 5; ++i)
    {
        std::string id = "T" + std::to_string(i);
        snap.trips[id] = Trip{"S1", "", "KI"};
        snap.stopTimes[id] = StopTimeEntry{StopVisit{at(9, minutes[i]), 1}, StopVisit{at(10, minutes[i]), 2}};
    }

    auto out = DepartureQuery::nextDepartures(snap, at(9, 0), 3);
    ASSERT_EQ(3u, out.size());
    EXPECT_EQ("09:05", out[0].dep);
    EXPECT_EQ("09:20", out[1].dep);
    EXPECT_EQ("09:30", out[2].dep);
    for (std::size_t i = 1; i < out.size(); ++i)
        EXPECT_LE(out[i - 1].depSec, out[i].depSec);
}

TEST(DepartureQuery, SameInputSameOutput)
{
    auto snap = scenario();
    snap.trips["T2"] = Trip{"S1", "", "KI"};
    snap.stopTimes["T2"] = StopTimeEntry{StopVisit{at(8, 15), 1}, StopVisit{at(8, 50), 2}};

    auto first = DepartureQuery::nextDepartures(snap, at(8, 0), 3);
    auto second = DepartureQuery::nextDepartures(snap, at(8, 0), 3);
    ASSERT_EQ(first.size(), second.size());
    for (std::size_t i = 0; i < first.size(); ++i)
    {
        EXPECT_EQ(first[i].dep, second[i].dep);
        EXPECT_EQ(first[i].arr, second[i].arr);
        EXPECT_EQ(first[i].line, second[i].line);
        EXPECT_EQ(first[i].headsign, second[i].headsign);
    }
}

TEST(DepartureQuery, FormatHhmm)
{
    EXPECT_EQ("00:00", DepartureQuery::formatHhmm(0));
    EXPECT_EQ("08:05", DepartureQuery::formatHhmm(at(8, 5) + 59));
    EXPECT_EQ("25:10", DepartureQuery::formatHhmm(at(25, 10)));
}
