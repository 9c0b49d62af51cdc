#pragma once
#include <chrono>
#include <memory>
#include <string>
#include "Types.hpp"

struct StationNames
{
    std::string origin;
    std::string destination;
};

// Turns extracted tables into a complete snapshot for one local date.
// Nothing is returned unless every step succeeded.
class SnapshotBuilder
{
public:
    static std::shared_ptr<FeedSnapshot const> build(FeedTables const& tables,
                                                     StationNames const& stations,
                                                     LocalNow const& today,
                                                     std::chrono::system_clock::time_point fetchedAt);
};
