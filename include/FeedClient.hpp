#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include <boost/asio.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast.hpp>
#include <boost/beast/ssl.hpp>
#include "FeedSource.hpp"

struct FeedUrl
{
    bool tls = true;
    std::string host;
    std::string port;
    std::string target;

    // http:// or https:// URLs only; throws std::invalid_argument otherwise.
    static FeedUrl parse(std::string const& url);
};

// Downloads the feed archive over HTTP(S) with Boost.Beast.
class FeedClient : public FeedSource
{
private:
    using Response = boost::beast::http::response<boost::beast::http::string_body>;
    using Request  = boost::beast::http::request<boost::beast::http::empty_body>;
    using TlsStream = boost::beast::ssl_stream<boost::beast::tcp_stream>;

    boost::asio::ssl::context sslContext;
    FeedUrl feedUrl;
    std::chrono::seconds timeout;
    std::uint64_t bodyLimit;

    static constexpr int kMaxRedirects = 5;

    void configureTlsStream(TlsStream& stream, std::string const& host);
    Request buildGetRequest(FeedUrl const& url) const;
    boost::asio::awaitable<boost::asio::ip::tcp::resolver::results_type> resolve(FeedUrl const& url);
    boost::asio::awaitable<Response> get(FeedUrl const& url);
    template <class Stream>
    boost::asio::awaitable<Response> exchange(Stream& stream, Request const& request);
    boost::asio::awaitable<void> shutdownStream(TlsStream& stream);

public:
    FeedClient(std::string const& url, std::chrono::seconds fetchTimeout, std::uint64_t maxBodyBytes);

    boost::asio::awaitable<std::string> fetchArchive() override;
};
