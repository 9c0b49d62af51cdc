#pragma once
#include <string>
#include <boost/asio/awaitable.hpp>

// Where the cache gets archive bytes from.
class FeedSource
{
public:
    virtual ~FeedSource() = default;
    virtual boost::asio::awaitable<std::string> fetchArchive() = 0;
};
