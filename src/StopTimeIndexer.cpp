#include "StopTimeIndexer.hpp"
#include <charconv>
#include <iostream>
#include <optional>
#include <string_view>
#include <vector>
#include "FeedError.hpp"
#include "Parser.hpp"

namespace
{
std::optional<uint32_t> parseSequence(std::string_view text)
{
    while (!text.empty() && text.front() == ' ') text.remove_prefix(1);
    while (!text.empty() && text.back() == ' ')  text.remove_suffix(1);
    if (text.empty())
        return std::nullopt;

    uint32_t value = 0;
    auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || end != text.data() + text.size())
        return std::nullopt;
    return value;
}
}

StopTimeIndexer::Index StopTimeIndexer::build(std::string_view stopTimesText, StationPair const& stations)
{
    Index idx;

    CsvTable header;
    header.name = "stop_times.txt";
    std::size_t iTrip = 0, iArr = 0, iDep = 0, iStop = 0, iSeq = 0;

    std::size_t rowsSeen = 0;
    std::size_t malformed = 0;

    Parser::forEachLine(stopTimesText, [&](std::string_view line)
    {
        if (header.header.empty())
        {
            header.header = Parser::splitLine(line);
            iTrip = header.requireColumn("trip_id");
            iArr  = header.requireColumn("arrival_time");
            iDep  = header.requireColumn("departure_time");
            iStop = header.requireColumn("stop_id");
            iSeq  = header.requireColumn("stop_sequence");
            return;
        }

        ++rowsSeen;

        // Neither id occurs anywhere in the line, so the stop column cannot match.
        if (line.find(stations.originId) == std::string_view::npos &&
            line.find(stations.destinationId) == std::string_view::npos)
            return;

        std::vector<std::string> cols = Parser::splitLine(line);
        if (cols.size() != header.header.size())
        {
            ++malformed;
            return;
        }

        std::string const& stopId = cols[iStop];
        bool isOrigin      = (stopId == stations.originId);
        bool isDestination = (stopId == stations.destinationId);
        if (!isOrigin && !isDestination)
            return;

        auto seq = parseSequence(cols[iSeq]);
        std::optional<int> dep, arr;
        if (isOrigin)
            dep = Parser::parseTimeOfDay(cols[iDep]);
        if (isDestination)
            arr = Parser::parseTimeOfDay(cols[iArr]);

        if (!seq || (isOrigin && !dep) || (isDestination && !arr))
        {
            ++malformed;
            return;
        }

        StopTimeEntry& entry = idx[cols[iTrip]];
        if (dep)
            entry.origin = StopVisit{*dep, *seq};
        if (arr)
            entry.destination = StopVisit{*arr, *seq};
    });

    if (header.header.empty())
        throw FeedError(FeedError::Kind::MissingTable, "stop_times.txt is empty");

    std::cout << "[Feed] stop_times.txt: " << rowsSeen << " rows scanned, "
              << idx.size() << " trips touch the station pair";
    if (malformed > 0)
        std::cout << " (" << malformed << " malformed rows skipped)";
    std::cout << "\n";

    return idx;
}
