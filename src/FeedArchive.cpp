#include "FeedArchive.hpp"
#include <iostream>
#include "miniz.h"
#include "FeedError.hpp"

struct FeedArchive::Impl
{
    mz_zip_archive zip{};
};

namespace
{
std::string_view baseName(std::string_view path)
{
    std::size_t slash = path.find_last_of('/');
    return slash == std::string_view::npos ? path : path.substr(slash + 1);
}

std::string fileName(mz_zip_archive* zip, mz_uint idx)
{
    mz_zip_archive_file_stat stat{};
    if (!mz_zip_reader_file_stat(zip, idx, &stat))
        throw FeedError(FeedError::Kind::Archive, "zip: cannot stat entry " + std::to_string(idx));
    return stat.m_filename;
}
}

FeedArchive::FeedArchive(std::string_view bytes)
    : impl(std::make_unique<Impl>())
{
    if (!mz_zip_reader_init_mem(&impl->zip, bytes.data(), bytes.size(), 0))
    {
        std::string reason = mz_zip_get_error_string(mz_zip_get_last_error(&impl->zip));
        throw FeedError(FeedError::Kind::Archive, "Feed is not a readable zip archive: " + reason);
    }
}

FeedArchive::~FeedArchive()
{
    mz_zip_reader_end(&impl->zip);
}

std::vector<std::string> FeedArchive::listFiles() const
{
    std::vector<std::string> names;
    mz_uint count = mz_zip_reader_get_num_files(&impl->zip);
    for (mz_uint i = 0; i < count; ++i)
    {
        if (mz_zip_reader_is_file_a_directory(&impl->zip, i))
            continue;
        names.push_back(fileName(&impl->zip, i));
    }
    return names;
}

std::optional<std::string> FeedArchive::read(std::string const& name) const
{
    int found = mz_zip_reader_locate_file(&impl->zip, name.c_str(), nullptr, 0);

    if (found < 0)
    {
        mz_uint count = mz_zip_reader_get_num_files(&impl->zip);
        for (mz_uint i = 0; i < count; ++i)
        {
            if (mz_zip_reader_is_file_a_directory(&impl->zip, i))
                continue;
            if (baseName(fileName(&impl->zip, i)) == name)
            {
                found = static_cast<int>(i);
                break;
            }
        }
    }

    if (found < 0)
        return std::nullopt;

    auto idx = static_cast<mz_uint>(found);
    mz_zip_archive_file_stat stat{};
    if (!mz_zip_reader_file_stat(&impl->zip, idx, &stat))
        throw FeedError(FeedError::Kind::Archive, "zip: cannot stat " + name);

    std::string content(static_cast<std::size_t>(stat.m_uncomp_size), '\0');
    if (!mz_zip_reader_extract_to_mem(&impl->zip, idx, content.data(), content.size(), 0))
        throw FeedError(FeedError::Kind::Archive, "zip: cannot extract " + name);

    return content;
}

FeedTables FeedArchive::extract(std::string_view bytes)
{
    FeedArchive archive(bytes);
    FeedTables tables;

    tables.stops         = archive.read("stops.txt");
    tables.routes        = archive.read("routes.txt");
    tables.trips         = archive.read("trips.txt");
    tables.stopTimes     = archive.read("stop_times.txt");
    tables.calendar      = archive.read("calendar.txt");
    tables.calendarDates = archive.read("calendar_dates.txt");

    if (!tables.stops || !tables.trips || !tables.stopTimes)
    {
        throw FeedError(FeedError::Kind::MissingTable,
                        "Missing required GTFS files in ZIP (stops/trips/stop_times).");
    }

    if (!tables.routes)        std::cout << "[Feed] routes.txt absent, using fallback line label\n";
    if (!tables.calendar)      std::cout << "[Feed] calendar.txt absent, no weekly rules\n";
    if (!tables.calendarDates) std::cout << "[Feed] calendar_dates.txt absent, no exceptions\n";

    return tables;
}
