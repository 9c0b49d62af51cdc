#include <iostream>
#include <stdexcept>
#include <boost/asio/redirect_error.hpp>
#include "FeedClient.hpp"
#include "FeedError.hpp"

namespace beast = boost::beast;
namespace http  = boost::beast::http;
namespace asio  = boost::asio;
using tcp = boost::asio::ip::tcp;

FeedUrl FeedUrl::parse(std::string const& url)
{
    FeedUrl out;
    std::string rest;

    if (url.rfind("https://", 0) == 0)
    {
        out.tls = true;
        rest = url.substr(8);
    }
    else if (url.rfind("http://", 0) == 0)
    {
        out.tls = false;
        rest = url.substr(7);
    }
    else
    {
        throw std::invalid_argument("Unsupported feed URL (http/https only): " + url);
    }

    std::size_t slash = rest.find('/');
    std::string authority = rest.substr(0, slash);
    out.target = (slash == std::string::npos) ? "/" : rest.substr(slash);

    std::size_t colon = authority.rfind(':');
    if (colon != std::string::npos)
    {
        out.host = authority.substr(0, colon);
        out.port = authority.substr(colon + 1);
    }
    else
    {
        out.host = authority;
        out.port = out.tls ? "443" : "80";
    }

    if (out.host.empty() || out.port.empty())
        throw std::invalid_argument("Feed URL has no host: " + url);

    return out;
}

FeedClient::FeedClient(std::string const& url, std::chrono::seconds fetchTimeout, std::uint64_t maxBodyBytes)
        : sslContext(asio::ssl::context::tlsv12_client)
        , feedUrl(FeedUrl::parse(url))
        , timeout(fetchTimeout)
        , bodyLimit(maxBodyBytes)
    {
        sslContext.set_options(
            asio::ssl::context::default_workarounds
            | asio::ssl::context::no_sslv2
            | asio::ssl::context::single_dh_use
        );

        sslContext.set_default_verify_paths();
        sslContext.set_verify_mode(asio::ssl::verify_peer);
    }

void FeedClient::configureTlsStream(TlsStream& stream, std::string const& host)
{
    if (!SSL_set_tlsext_host_name(stream.native_handle(), host.c_str()))
    {
        throw beast::system_error(boost::system::error_code(static_cast<int>(::ERR_get_error()), asio::error::get_ssl_category()), "Failed to set SNI");
    }
    stream.set_verify_callback(asio::ssl::host_name_verification(host));
}

asio::awaitable<tcp::resolver::results_type> FeedClient::resolve(FeedUrl const& url)
{
    tcp::resolver resolver(co_await asio::this_coro::executor);
    tcp::resolver::results_type results = co_await resolver.async_resolve(url.host, url.port, asio::use_awaitable);
    co_return results;
}

FeedClient::Request FeedClient::buildGetRequest(FeedUrl const& url) const
{
    Request request(http::verb::get, url.target, 11);
    request.set(http::field::host, url.host);
    request.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
    request.set(http::field::accept, "application/zip, */*");

    return request;
}

template <class Stream>
asio::awaitable<FeedClient::Response> FeedClient::exchange(Stream& stream, Request const& request)
{
    beast::get_lowest_layer(stream).expires_after(timeout);
    co_await http::async_write(stream, request, asio::use_awaitable);

    beast::flat_buffer buffer;
    http::response_parser<http::string_body> parser;
    parser.body_limit(bodyLimit);

    beast::get_lowest_layer(stream).expires_after(timeout);
    co_await http::async_read(stream, buffer, parser, asio::use_awaitable);
    co_return parser.release();
}

asio::awaitable<void> FeedClient::shutdownStream(TlsStream& stream)
{
    boost::system::error_code ec;
    beast::get_lowest_layer(stream).expires_after(std::chrono::seconds(5));
    co_await stream.async_shutdown(asio::redirect_error(asio::use_awaitable, ec));
    co_return;
}

asio::awaitable<FeedClient::Response> FeedClient::get(FeedUrl const& url)
{
    auto executor = co_await asio::this_coro::executor;
    tcp::resolver::results_type results = co_await resolve(url);
    Request request = buildGetRequest(url);

    if (url.tls)
    {
        TlsStream stream(executor, sslContext);
        configureTlsStream(stream, url.host);

        beast::get_lowest_layer(stream).expires_after(timeout);
        co_await beast::get_lowest_layer(stream).async_connect(results, asio::use_awaitable);

        beast::get_lowest_layer(stream).expires_after(timeout);
        co_await stream.async_handshake(asio::ssl::stream_base::client, asio::use_awaitable);

        Response response = co_await exchange(stream, request);
        co_await shutdownStream(stream);
        co_return response;
    }

    beast::tcp_stream stream(executor);
    stream.expires_after(timeout);
    co_await stream.async_connect(results, asio::use_awaitable);

    Response response = co_await exchange(stream, request);

    boost::system::error_code ignore;
    stream.socket().shutdown(tcp::socket::shutdown_both, ignore);
    co_return response;
}

asio::awaitable<std::string> FeedClient::fetchArchive()
{
    FeedUrl url = feedUrl;

    for (int hop = 0; hop <= kMaxRedirects; ++hop)
    {
        Response response;
        try
        {
            std::cout << "[Feed] GET " << (url.tls ? "https://" : "http://") << url.host << url.target << std::endl;
            response = co_await get(url);
        }
        catch (boost::system::system_error const& e)
        {
            if (e.code() == beast::error::timeout)
                throw FeedError(FeedError::Kind::Timeout, "GTFS download timed out after " + std::to_string(timeout.count()) + "s");
            throw FeedError(FeedError::Kind::Fetch, std::string("GTFS download failed: ") + e.what());
        }

        unsigned status = response.result_int();
        if (status >= 200 && status < 300)
        {
            std::cout << "[Feed] Downloaded " << response.body().size() << " bytes" << std::endl;
            co_return std::move(response.body());
        }

        if (status == 301 || status == 302 || status == 303 || status == 307 || status == 308)
        {
            auto location = response.find(http::field::location);
            if (location == response.end())
                throw FeedError(FeedError::Kind::Fetch, "GTFS download failed: redirect without Location");

            std::string next(location->value());
            if (!next.empty() && next.front() == '/')
                url.target = next;
            else
                url = FeedUrl::parse(next);
            continue;
        }

        throw FeedError(FeedError::Kind::Fetch, "GTFS download failed: " + std::to_string(status));
    }

    throw FeedError(FeedError::Kind::Fetch, "GTFS download failed: too many redirects");
}
