#pragma once
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "Types.hpp"

// Read-only view of a GTFS zip archive held in memory. The bytes must
// outlive the archive.
class FeedArchive
{
public:
    explicit FeedArchive(std::string_view bytes);
    ~FeedArchive();

    FeedArchive(FeedArchive const&) = delete;
    FeedArchive& operator=(FeedArchive const&) = delete;

    std::vector<std::string> listFiles() const;

    // Exact entry name first, then any entry with that base name.
    std::optional<std::string> read(std::string const& name) const;

    // All six tables; missing mandatory ones throw FeedError(MissingTable).
    static FeedTables extract(std::string_view bytes);

private:
    struct Impl;
    std::unique_ptr<Impl> impl;
};
