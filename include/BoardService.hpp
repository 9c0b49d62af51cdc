#pragma once
#include <cstddef>
#include <string>
#include <boost/asio/awaitable.hpp>
#include "Clock.hpp"
#include "DepartureQuery.hpp"
#include "FeedCache.hpp"

struct BoardReply
{
    bool ok;
    std::string body;
};

// One board request: refresh if needed, query, render. Never throws for
// feed failures; those become an error body with ok == false.
class BoardService
{
private:
    FeedCache& cache;
    Clock const& clock;
    std::string title;
    std::size_t limit;
    DepartureLabels labels;

public:
    BoardService(FeedCache& feedCache, Clock const& wallClock, std::string boardTitle,
                 std::size_t departureLimit, DepartureLabels fallbackLabels);

    boost::asio::awaitable<BoardReply> render();
};
