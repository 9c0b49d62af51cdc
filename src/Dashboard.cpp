#include <boost/json/src.hpp>
#include "Dashboard.hpp"

namespace json = boost::json;

namespace
{
json::object buildDeparture(Departure const& d)
{
    json::object row;
    row["dep"]      = d.dep;
    row["arr"]      = d.arr;
    row["line"]     = d.line;
    row["headsign"] = d.headsign;
    return row;
}
}

std::string Dashboard::generate(std::string const& title, LocalNow const& now,
                                std::vector<Departure> const& departures)
{
    json::array rows;
    for (const auto& d : departures)
    {
        rows.push_back(buildDeparture(d));
    }

    json::object body;
    body["title"]      = title;
    body["updated"]    = now.hhmm;
    body["departures"] = std::move(rows);

    return json::serialize(body);
}

std::string Dashboard::generateError(std::string const& title, std::string const& error)
{
    json::object body;
    body["title"]      = title;
    body["updated"]    = nullptr;
    body["departures"] = json::array{};
    body["error"]      = error;

    return json::serialize(body);
}
