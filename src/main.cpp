#include <string>
#include <iostream>
#include <memory>
#include <optional>
#include <ctime>
#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/use_future.hpp>
#include "BoardService.hpp"
#include "Clock.hpp"
#include "ConfigurationManager.hpp"
#include "FeedCache.hpp"
#include "FeedClient.hpp"

boost::asio::awaitable<void> warmUp(FeedCache& cache)
{
    try
    {
        co_await cache.ensureFresh();
    }
    catch (std::exception const& e)
    {
        std::cerr << "[System] Initial feed load failed, will retry on first request: " << e.what() << std::endl;
    }
}

std::string buildHttpResponse(BoardReply const& reply)
{
    std::string response =
        std::string(reply.ok ? "HTTP/1.1 200 OK\r\n" : "HTTP/1.1 500 Internal Server Error\r\n") +
        "Content-Type: application/json; charset=utf-8\r\n";

    if (reply.ok)
        response += "Cache-Control: s-maxage=60, stale-while-revalidate=300\r\n";

    response +=
        "Content-Length: " + std::to_string(reply.body.size()) + "\r\n"
        "Connection: close\r\n\r\n" +
        reply.body;

    return response;
}

boost::asio::awaitable<void> handleHttpClient(std::shared_ptr<boost::asio::ip::tcp::socket> socket, BoardService& board)
{
    try
    {
        boost::asio::streambuf buffer;

        co_await boost::asio::async_read_until(*socket, buffer, "\r\n\r\n", boost::asio::use_awaitable);

        BoardReply reply = co_await board.render();
        std::string response = buildHttpResponse(reply);

        co_await boost::asio::async_write(*socket, boost::asio::buffer(response), boost::asio::use_awaitable);

        boost::system::error_code ignore;
        socket->shutdown(boost::asio::ip::tcp::socket::shutdown_both, ignore);
    }
    catch (boost::system::system_error const& e)
    {
        auto code = e.code();
        if (code == boost::asio::error::operation_aborted ||
            code == boost::asio::error::connection_reset ||
            code == boost::asio::error::connection_aborted ||
            code == boost::asio::error::eof)
        {
            co_return;
        }

        std::cerr << "[HTTP] handler error: " << e.what() << "\n";
    }
    catch (std::exception const& e)
    {
        std::cerr << "[HTTP] handler error: " << e.what() << "\n";
    }
}

boost::asio::awaitable<void> httpAcceptLoop(boost::asio::ip::tcp::acceptor& acceptor, BoardService& board)
{
    for (;;)
    {
        auto socket = std::make_shared<boost::asio::ip::tcp::socket>(co_await boost::asio::this_coro::executor);

        co_await acceptor.async_accept(*socket, boost::asio::use_awaitable);
        boost::asio::co_spawn(socket->get_executor(), handleHttpClient(socket, board), boost::asio::detached);
    }
}

void parseCommandLineArgs(int argc, char* argv[], bool& onceMode, std::optional<std::time_t>& pinnedAt)
{
    onceMode = false;
    pinnedAt.reset();

    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];

        if (arg == "--once")
        {
            onceMode = true;
        }
        else if (arg == "--at" && i + 1 < argc)
        {
            pinnedAt = static_cast<std::time_t>(std::stoll(argv[++i]));
        }
        else
        {
            std::cerr << "Warning: ignoring unknown or malformed argument: " << arg << "\n";
        }
    }
}

int main(int argc, char* argv[])
{
    try
    {
        bool onceMode = false;
        std::optional<std::time_t> pinnedAt;

        parseCommandLineArgs(argc, argv, onceMode, pinnedAt);

        ConfigurationManager config;
        ZonedClock clock(config.getTimeZone());
        if (pinnedAt)
        {
            clock.pin(*pinnedAt);
            std::cout << "[System] Clock pinned at " << *pinnedAt << " (" << clock.localNow().date << " " << clock.localNow().hhmm << ")\n";
        }

        FeedClient client(config.getFeedUrl(), config.getFetchTimeout(), config.getMaxArchiveBytes());
        FeedCache cache(client, clock, config.getStations(), config.getCacheTtl());
        BoardService board(cache, clock, config.getTitle(), config.getDepartureLimit(), config.getLabels());

        boost::asio::io_context io;

        if (onceMode)
        {
            auto result = boost::asio::co_spawn(io, board.render(), boost::asio::use_future);
            io.run();

            BoardReply reply = result.get();
            std::cout << reply.body << std::endl;
            return reply.ok ? 0 : 1;
        }

        boost::asio::ip::tcp::acceptor acceptor(io, {boost::asio::ip::tcp::v4(), config.getHttpPort()});

        std::cout << "System Initialized.\n"
                  << "   -> Board active at http://localhost:" << config.getHttpPort() << "\n";

        boost::asio::co_spawn(io, warmUp(cache), boost::asio::detached);
        boost::asio::co_spawn(io, httpAcceptLoop(acceptor, board), boost::asio::detached);

        io.run();
    }
    catch (const std::exception& e)
    {
        std::cerr << "Main Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
