#pragma once
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>
#include "Types.hpp"

// Header plus data rows of one comma separated table.
struct CsvTable
{
    std::string name;
    std::vector<std::string> header;
    std::vector<std::vector<std::string>> rows;
    std::size_t droppedRows = 0;

    [[nodiscard]] std::optional<std::size_t> findColumn(std::string_view column) const;

    // Throws FeedError(MissingColumn) when the header lacks the column.
    [[nodiscard]] std::size_t requireColumn(std::string_view column) const;
};

class Parser
{
public:
    // Splits one line on commas outside of quotes; "" inside quotes is a literal quote.
    static std::vector<std::string> splitLine(std::string_view line);

    // Calls fn for every non-empty line, CR stripped, byte order mark removed.
    static void forEachLine(std::string_view text, std::function<void(std::string_view)> const& fn);

    // Rows whose field count differs from the header are dropped and counted.
    static CsvTable parseTable(std::string_view text, std::string name);

    static std::unordered_map<std::string, Route> readRoutes(std::string_view text);
    static std::unordered_map<std::string, Trip> readTrips(std::string_view text);
    static std::vector<CalendarRule> readCalendar(std::string_view text);
    static std::vector<CalendarException> readCalendarDates(std::string_view text);

    // "HH:MM:SS" to seconds since midnight, hours above 23 kept as is.
    static std::optional<int> parseTimeOfDay(std::string_view hhmmss);
};
