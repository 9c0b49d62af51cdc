#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include "DepartureQuery.hpp"
#include "SnapshotBuilder.hpp"

class ConfigurationManager
{
private:
    std::string feedUrl;
    StationNames stations;
    std::string title;
    std::string timeZone;
    std::chrono::seconds cacheTtl;
    std::chrono::seconds fetchTimeout;
    std::uint64_t maxArchiveBytes;
    unsigned short httpPort;
    std::size_t departureLimit;
    DepartureLabels labels;

public:
    ConfigurationManager();

    static inline const std::string DEFAULT_GTFS_URL =
        "https://assets.metrolinx.com/raw/upload/Documents/Metrolinx/Open%20Data/GO-GTFS.zip";
    static inline const std::string DEFAULT_TITLE = "GO Train \xE2\x80\x94 Bloor \xE2\x86\x92 Union";

    [[nodiscard]] std::string const& getFeedUrl() const noexcept;
    [[nodiscard]] StationNames const& getStations() const noexcept;
    [[nodiscard]] std::string const& getTitle() const noexcept;
    [[nodiscard]] std::string const& getTimeZone() const noexcept;
    [[nodiscard]] std::chrono::seconds getCacheTtl() const noexcept;
    [[nodiscard]] std::chrono::seconds getFetchTimeout() const noexcept;
    [[nodiscard]] std::uint64_t getMaxArchiveBytes() const noexcept;
    [[nodiscard]] unsigned short getHttpPort() const noexcept;
    [[nodiscard]] std::size_t getDepartureLimit() const noexcept;
    [[nodiscard]] DepartureLabels const& getLabels() const noexcept;
};
