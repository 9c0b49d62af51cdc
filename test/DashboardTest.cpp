#include "gtest/gtest.h"

#include <boost/json.hpp>
#include "Dashboard.hpp"
#include "TestFeed.hpp"

namespace json = boost::json;

TEST(Dashboard, RendersDepartures)
{
    std::vector<Departure> deps = {
        {"08:15", "08:42", "KI", "Union Station", 29700},
        {"25:10", "25:40", "GO", "Union, \"Late\"", 90600},
    };

    json::value v = json::parse(Dashboard::generate("GO Train", testfeed::monday(8 * 3600), deps));
    auto const& body = v.as_object();

    EXPECT_EQ("GO Train", body.at("title").as_string());
    EXPECT_EQ("08:00", body.at("updated").as_string());
    EXPECT_FALSE(body.contains("error"));

    auto const& rows = body.at("departures").as_array();
    ASSERT_EQ(2u, rows.size());
    EXPECT_EQ("08:15", rows[0].as_object().at("dep").as_string());
    EXPECT_EQ("08:42", rows[0].as_object().at("arr").as_string());
    EXPECT_EQ("KI", rows[0].as_object().at("line").as_string());
    EXPECT_EQ("Union, \"Late\"", rows[1].as_object().at("headsign").as_string());
    EXPECT_FALSE(rows[0].as_object().contains("depSec"));
}

TEST(Dashboard, RendersError)
{
    json::value v = json::parse(Dashboard::generateError("GO Train", "GTFS download failed: 503"));
    auto const& body = v.as_object();

    EXPECT_EQ("GO Train", body.at("title").as_string());
    EXPECT_TRUE(body.at("updated").is_null());
    EXPECT_TRUE(body.at("departures").as_array().empty());
    EXPECT_EQ("GTFS download failed: 503", body.at("error").as_string());
}

TEST(Dashboard, KeyOrder)
{
    std::string out = Dashboard::generate("T", testfeed::monday(0), {});
    EXPECT_EQ(R"({"title":"T","updated":"00:00","departures":[]})", out);
}
