#include <cstdlib>
#include <limits>
#include <stdexcept>
#include "ConfigurationManager.hpp"

namespace
{
std::string envOr(char const* name, std::string const& fallback)
{
    const char* value = std::getenv(name);
    if (!value || !*value) return fallback;
    return value;
}

std::uint64_t envNumber(char const* name, std::uint64_t fallback, std::uint64_t min, std::uint64_t max)
{
    const char* value = std::getenv(name);
    if (!value || !*value) return fallback;

    std::size_t used = 0;
    unsigned long long parsed = 0;
    try
    {
        parsed = std::stoull(value, &used);
    }
    catch (std::exception const&)
    {
        throw std::runtime_error(std::string(name) + " is not a number: " + value);
    }

    if (used != std::string(value).size() || parsed < min || parsed > max)
        throw std::runtime_error(std::string(name) + " out of range: " + value);
    return parsed;
}
}

ConfigurationManager::ConfigurationManager()
{
    feedUrl = envOr("GTFS_URL", DEFAULT_GTFS_URL);
    stations.origin      = envOr("ORIGIN_STATION", "bloor");
    stations.destination = envOr("DESTINATION_STATION", "union station");
    title    = envOr("BOARD_TITLE", DEFAULT_TITLE);
    timeZone = envOr("TIME_ZONE", "America/Toronto");

    cacheTtl        = std::chrono::seconds(envNumber("CACHE_TTL_SECONDS", 6 * 60 * 60, 1, 7 * 24 * 60 * 60));
    fetchTimeout    = std::chrono::seconds(envNumber("FETCH_TIMEOUT_SECONDS", 120, 1, 3600));
    maxArchiveBytes = envNumber("MAX_ARCHIVE_BYTES", 256ull * 1024 * 1024, 1024, std::numeric_limits<std::uint32_t>::max());
    httpPort        = static_cast<unsigned short>(envNumber("HTTP_PORT", 8080, 1, 65535));
    departureLimit  = static_cast<std::size_t>(envNumber("DEPARTURE_LIMIT", 3, 1, 100));

    labels.line     = envOr("DEFAULT_LINE_LABEL", "GO");
    labels.headsign = envOr("DEFAULT_HEADSIGN", "Union Station");
}

std::string const& ConfigurationManager::getFeedUrl() const noexcept { return feedUrl; }
StationNames const& ConfigurationManager::getStations() const noexcept { return stations; }
std::string const& ConfigurationManager::getTitle() const noexcept { return title; }
std::string const& ConfigurationManager::getTimeZone() const noexcept { return timeZone; }
std::chrono::seconds ConfigurationManager::getCacheTtl() const noexcept { return cacheTtl; }
std::chrono::seconds ConfigurationManager::getFetchTimeout() const noexcept { return fetchTimeout; }
std::uint64_t ConfigurationManager::getMaxArchiveBytes() const noexcept { return maxArchiveBytes; }
unsigned short ConfigurationManager::getHttpPort() const noexcept { return httpPort; }
std::size_t ConfigurationManager::getDepartureLimit() const noexcept { return departureLimit; }
DepartureLabels const& ConfigurationManager::getLabels() const noexcept { return labels; }
