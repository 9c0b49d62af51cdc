#include "FeedCache.hpp"
#include <iostream>
#include <boost/system/system_error.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include "FeedArchive.hpp"

FeedCache::FeedCache(FeedSource& feedSource, Clock const& wallClock, StationNames targets, std::chrono::seconds timeToLive)
    : source(feedSource)
    , clock(wallClock)
    , stations(std::move(targets))
    , ttl(timeToLive)
{
}

SnapshotPtr FeedCache::snapshot() const
{
    std::lock_guard<std::mutex> lock(mutex);
    return current;
}

bool FeedCache::isStale(SnapshotPtr const& snap) const
{
    if (!snap)
        return true;
    if (clock.instant() - snap->fetchedAt >= ttl)
        return true;

    // The active-service set belongs to one date only.
    return snap->serviceDate != clock.localNow().date;
}

void FeedCache::install(SnapshotPtr snap)
{
    std::lock_guard<std::mutex> lock(mutex);
    current = std::move(snap);
}

boost::asio::awaitable<SnapshotPtr> FeedCache::refresh()
{
    LocalNow today = clock.localNow();
    std::cout << "[Cache] Refreshing feed for " << today.date << std::endl;

    std::string bytes = co_await source.fetchArchive();
    FeedTables tables = FeedArchive::extract(bytes);
    co_return SnapshotBuilder::build(tables, stations, today, clock.instant());
}

boost::asio::awaitable<SnapshotPtr> FeedCache::ensureFresh()
{
    SnapshotPtr snap = snapshot();
    if (!isStale(snap))
        co_return snap;

    if (inFlight)
    {
        std::shared_ptr<Refresh> flight = inFlight;
        if (!flight->finished)
        {
            boost::system::error_code ec;
            co_await flight->done.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));

            // Woken by anything other than the refresher finishing.
            if (!flight->finished)
                throw boost::system::system_error(ec ? ec : boost::asio::error::operation_aborted);
        }
        if (flight->error)
            std::rethrow_exception(flight->error);
        co_return flight->result;
    }

    auto flight = std::make_shared<Refresh>(co_await boost::asio::this_coro::executor);
    inFlight = flight;
    ++refreshes;

    try
    {
        flight->result = co_await refresh();
        install(flight->result);
        std::cout << "[Cache] Snapshot installed (" << flight->result->stopTimes.size() << " indexed trips)" << std::endl;
    }
    catch (std::exception const& e)
    {
        std::cerr << "[Cache] Refresh failed, keeping previous snapshot: " << e.what() << std::endl;
        flight->error = std::current_exception();
    }

    flight->finished = true;
    inFlight.reset();
    flight->done.cancel();

    if (flight->error)
        std::rethrow_exception(flight->error);
    co_return flight->result;
}
