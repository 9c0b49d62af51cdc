#pragma once
#include <chrono>
#include <cstddef>
#include <exception>
#include <memory>
#include <mutex>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>
#include "Clock.hpp"
#include "FeedSource.hpp"
#include "SnapshotBuilder.hpp"
#include "Types.hpp"

using SnapshotPtr = std::shared_ptr<FeedSnapshot const>;

// Holds the current snapshot and rebuilds it from the feed when it expires
// or when the local date has moved on. Callers arriving while a refresh is
// running wait for that refresh instead of starting their own. ensureFresh()
// must be driven from a single io_context thread.
class FeedCache
{
public:
    static constexpr std::chrono::seconds kDefaultTtl{6 * 60 * 60};

    FeedCache(FeedSource& feedSource, Clock const& wallClock, StationNames targets,
              std::chrono::seconds timeToLive = kDefaultTtl);

    boost::asio::awaitable<SnapshotPtr> ensureFresh();

    [[nodiscard]] SnapshotPtr snapshot() const;
    [[nodiscard]] bool isStale(SnapshotPtr const& snap) const;
    [[nodiscard]] std::size_t refreshCount() const noexcept { return refreshes; }

private:
    struct Refresh
    {
        explicit Refresh(boost::asio::any_io_executor const& ex)
            : done(ex, boost::asio::steady_timer::time_point::max())
        {
        }

        boost::asio::steady_timer done;
        bool finished = false;
        SnapshotPtr result;
        std::exception_ptr error;
    };

    boost::asio::awaitable<SnapshotPtr> refresh();
    void install(SnapshotPtr snap);

    FeedSource& source;
    Clock const& clock;
    StationNames stations;
    std::chrono::seconds ttl;

    mutable std::mutex mutex;
    SnapshotPtr current;
    std::shared_ptr<Refresh> inFlight;
    std::size_t refreshes = 0;
};
