#include "Parser.hpp"
#include <array>
#include <charconv>
#include <iostream>
#include "FeedError.hpp"

namespace
{
constexpr std::string_view kByteOrderMark = "\xEF\xBB\xBF";

constexpr int kMaxServiceHour = 99;

std::optional<int> toNumber(std::string_view text)
{
    while (!text.empty() && text.front() == ' ') text.remove_prefix(1);
    while (!text.empty() && text.back() == ' ')  text.remove_suffix(1);
    if (text.empty())
        return std::nullopt;

    int value = 0;
    auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || end != text.data() + text.size())
        return std::nullopt;
    return value;
}

void reportDropped(CsvTable const& table, std::size_t invalid)
{
    std::size_t total = table.droppedRows + invalid;
    if (total > 0)
    {
        std::cerr << "[Feed] " << table.name << ": skipped " << total << " malformed rows\n";
    }
}
}

std::optional<std::size_t> CsvTable::findColumn(std::string_view column) const
{
    for (std::size_t i = 0; i < header.size(); ++i)
    {
        if (header[i] == column)
            return i;
    }
    return std::nullopt;
}

std::size_t CsvTable::requireColumn(std::string_view column) const
{
    auto idx = findColumn(column);
    if (!idx)
    {
        throw FeedError(FeedError::Kind::MissingColumn,
                        name + " has no column " + std::string(column));
    }
    return *idx;
}

std::vector<std::string> Parser::splitLine(std::string_view line)
{
    std::vector<std::string> out;
    std::string cur;
    bool inQuotes = false;

    for (std::size_t i = 0; i < line.size(); ++i)
    {
        char ch = line[i];
        if (ch == '"')
        {
            if (inQuotes && i + 1 < line.size() && line[i + 1] == '"')
            {
                cur += '"';
                ++i;
            }
            else
            {
                inQuotes = !inQuotes;
            }
        }
        else if (ch == ',' && !inQuotes)
        {
            out.push_back(std::move(cur));
            cur.clear();
        }
        else
        {
            cur += ch;
        }
    }
    out.push_back(std::move(cur));
    return out;
}

void Parser::forEachLine(std::string_view text, std::function<void(std::string_view)> const& fn)
{
    if (text.substr(0, kByteOrderMark.size()) == kByteOrderMark)
        text.remove_prefix(kByteOrderMark.size());

    while (!text.empty())
    {
        std::size_t nl = text.find('\n');
        std::string_view line = text.substr(0, nl);
        text = (nl == std::string_view::npos) ? std::string_view{} : text.substr(nl + 1);

        if (!line.empty() && line.back() == '\r')
            line.remove_suffix(1);
        if (line.empty())
            continue;

        fn(line);
    }
}

CsvTable Parser::parseTable(std::string_view text, std::string name)
{
    CsvTable table;
    table.name = std::move(name);
    bool first = true;

    forEachLine(text, [&](std::string_view line)
    {
        if (first)
        {
            table.header = splitLine(line);
            first = false;
            return;
        }

        auto cols = splitLine(line);
        if (cols.size() != table.header.size())
        {
            ++table.droppedRows;
            return;
        }
        table.rows.push_back(std::move(cols));
    });

    return table;
}

std::unordered_map<std::string, Route> Parser::readRoutes(std::string_view text)
{
    CsvTable table = parseTable(text, "routes.txt");
    std::size_t iId = table.requireColumn("route_id");
    auto iShort = table.findColumn("route_short_name");
    auto iLong  = table.findColumn("route_long_name");

    std::unordered_map<std::string, Route> routes;
    for (auto& row : table.rows)
    {
        Route r;
        if (iShort) r.shortName = std::move(row[*iShort]);
        if (iLong)  r.longName  = std::move(row[*iLong]);
        routes[row[iId]] = std::move(r);
    }

    reportDropped(table, 0);
    return routes;
}

std::unordered_map<std::string, Trip> Parser::readTrips(std::string_view text)
{
    CsvTable table = parseTable(text, "trips.txt");
    std::size_t iTrip    = table.requireColumn("trip_id");
    std::size_t iService = table.requireColumn("service_id");
    std::size_t iRoute   = table.requireColumn("route_id");
    auto iHeadsign = table.findColumn("trip_headsign");

    std::unordered_map<std::string, Trip> trips;
    trips.reserve(table.rows.size());
    for (auto& row : table.rows)
    {
        Trip t;
        t.serviceId = std::move(row[iService]);
        t.routeId   = std::move(row[iRoute]);
        if (iHeadsign) t.headsign = std::move(row[*iHeadsign]);
        trips[row[iTrip]] = std::move(t);
    }

    reportDropped(table, 0);
    return trips;
}

std::vector<CalendarRule> Parser::readCalendar(std::string_view text)
{
    static constexpr std::array<std::string_view, 7> kDays = {
        "monday", "tuesday", "wednesday", "thursday", "friday", "saturday", "sunday"
    };

    CsvTable table = parseTable(text, "calendar.txt");
    std::size_t iService = table.requireColumn("service_id");
    std::size_t iStart   = table.requireColumn("start_date");
    std::size_t iEnd     = table.requireColumn("end_date");
    std::array<std::size_t, 7> iDays{};
    for (std::size_t d = 0; d < kDays.size(); ++d)
        iDays[d] = table.requireColumn(kDays[d]);

    std::vector<CalendarRule> rules;
    rules.reserve(table.rows.size());
    for (auto& row : table.rows)
    {
        CalendarRule rule;
        rule.serviceId = std::move(row[iService]);
        rule.startDate = std::move(row[iStart]);
        rule.endDate   = std::move(row[iEnd]);
        for (std::size_t d = 0; d < kDays.size(); ++d)
            rule.weekdays[d] = (toNumber(row[iDays[d]]) == 1);
        rules.push_back(std::move(rule));
    }

    reportDropped(table, 0);
    return rules;
}

std::vector<CalendarException> Parser::readCalendarDates(std::string_view text)
{
    CsvTable table = parseTable(text, "calendar_dates.txt");
    std::size_t iService = table.requireColumn("service_id");
    std::size_t iDate    = table.requireColumn("date");
    std::size_t iType    = table.requireColumn("exception_type");

    std::vector<CalendarException> exceptions;
    exceptions.reserve(table.rows.size());
    std::size_t invalid = 0;
    for (auto& row : table.rows)
    {
        auto type = toNumber(row[iType]);
        if (type != 1 && type != 2)
        {
            ++invalid;
            continue;
        }

        exceptions.push_back({std::move(row[iService]),
                              std::move(row[iDate]),
                              *type == 1 ? CalendarException::Type::Add
                                         : CalendarException::Type::Remove});
    }

    reportDropped(table, invalid);
    return exceptions;
}

std::optional<int> Parser::parseTimeOfDay(std::string_view hhmmss)
{
    std::size_t c1 = hhmmss.find(':');
    if (c1 == std::string_view::npos)
        return std::nullopt;
    std::size_t c2 = hhmmss.find(':', c1 + 1);
    if (c2 == std::string_view::npos)
        return std::nullopt;

    auto h = toNumber(hhmmss.substr(0, c1));
    auto m = toNumber(hhmmss.substr(c1 + 1, c2 - c1 - 1));
    auto s = toNumber(hhmmss.substr(c2 + 1));
    if (!h || !m || !s || *h < 0 || *m < 0 || *m > 59 || *s < 0 || *s > 59)
        return std::nullopt;
    // Service days run past 24:00 but never by days.
    if (*h > kMaxServiceHour)
        return std::nullopt;

    return (*h * 3600) + (*m * 60) + *s;
}
