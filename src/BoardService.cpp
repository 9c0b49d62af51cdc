#include "BoardService.hpp"
#include <iostream>
#include "Dashboard.hpp"

BoardService::BoardService(FeedCache& feedCache, Clock const& wallClock, std::string boardTitle,
                           std::size_t departureLimit, DepartureLabels fallbackLabels)
    : cache(feedCache)
    , clock(wallClock)
    , title(std::move(boardTitle))
    , limit(departureLimit)
    , labels(std::move(fallbackLabels))
{
}

boost::asio::awaitable<BoardReply> BoardService::render()
{
    std::string error;
    try
    {
        SnapshotPtr snap = co_await cache.ensureFresh();
        LocalNow now = clock.localNow();
        auto departures = DepartureQuery::nextDepartures(*snap, now.secondsOfDay, limit, labels);
        co_return BoardReply{true, Dashboard::generate(title, now, departures)};
    }
    catch (std::exception const& e)
    {
        error = e.what();
    }

    std::cerr << "[HTTP] Board failed: " << error << "\n";
    co_return BoardReply{false, Dashboard::generateError(title, error)};
}
