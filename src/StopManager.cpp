#include "StopManager.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include "FeedError.hpp"
#include "Parser.hpp"

namespace
{
std::string toLower(std::string_view s)
{
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}
}

StopManager::StopManager(std::string_view stopsText)
{
    CsvTable table = Parser::parseTable(stopsText, "stops.txt");
    std::size_t iId   = table.requireColumn("stop_id");
    std::size_t iName = table.requireColumn("stop_name");

    stops.reserve(table.rows.size());
    for (auto& row : table.rows)
    {
        if (row[iId].empty())
            continue;

        byId.emplace(row[iId], stops.size());
        stops.push_back({std::move(row[iId]), std::move(row[iName])});
    }

    std::cout << "[Feed] Loaded " << stops.size() << " stops";
    if (table.droppedRows > 0)
        std::cout << " (" << table.droppedRows << " malformed rows skipped)";
    std::cout << "\n";
}

std::string StopManager::getName(std::string const& stopId) const
{
    auto it = byId.find(stopId);
    if (it != byId.end())
        return stops[it->second].name;

    return stopId;
}

std::optional<std::string> StopManager::findByName(std::string_view needle) const
{
    std::string lowered = toLower(needle);
    for (auto const& s : stops)
    {
        if (toLower(s.name).find(lowered) != std::string::npos)
            return s.id;
    }
    return std::nullopt;
}

std::string StopManager::resolve(std::string_view needle) const
{
    auto id = findByName(needle);
    if (!id)
    {
        throw FeedError(FeedError::Kind::UnresolvedStation,
                        "Could not find a stop named like '" + std::string(needle) + "' in stops.txt");
    }
    return *id;
}
