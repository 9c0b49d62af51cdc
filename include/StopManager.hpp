#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

class StopManager
{
private:
    struct Stop
    {
        std::string id;
        std::string name;
    };

    std::vector<Stop> stops;                       // stops.txt order
    std::unordered_map<std::string, std::size_t> byId;

public:
    explicit StopManager(std::string_view stopsText);

    [[nodiscard]] std::size_t size() const noexcept { return stops.size(); }
    std::string getName(std::string const& stopId) const;

    // First stop in table order whose name contains needle, ignoring case.
    std::optional<std::string> findByName(std::string_view needle) const;

    // Throws FeedError(UnresolvedStation) when nothing matches.
    std::string resolve(std::string_view needle) const;
};
