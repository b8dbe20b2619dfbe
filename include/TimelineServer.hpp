#pragma once
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <boost/asio.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/beast.hpp>
#include "RouteCache.hpp"

class AmtrakClient;
class ConfigurationManager;
class TimelineRenderer;

struct TimelineQuery
{
    std::vector<std::string> stations;
    std::chrono::minutes bufferBefore{0};
    std::chrono::minutes bufferAfter{0};
};

struct QueryParse
{
    std::optional<TimelineQuery> query;
    unsigned status = 200;
    std::string error;
};

// Serves /trains?stations=A,B,C and /trains/A/B/C as PNG timelines.
class TimelineServer
{
public:
    using HttpRequest = boost::beast::http::request<boost::beast::http::string_body>;
    using HttpResponse = boost::beast::http::response<boost::beast::http::string_body>;

private:
    boost::asio::io_context& ioContext;
    AmtrakClient& client;
    TimelineRenderer const& renderer;
    ConfigurationManager const& config;
    RouteCache cache;

    boost::asio::awaitable<TimelineDocument> refreshRoute(std::vector<std::string> stations);
    boost::asio::awaitable<TimelineDocument> getRoute(std::vector<std::string> stations);
    boost::asio::awaitable<void> refreshLoop();
    boost::asio::awaitable<void> acceptLoop(boost::asio::ip::tcp::acceptor& acceptor);
    boost::asio::awaitable<void> handleClient(std::shared_ptr<boost::asio::ip::tcp::socket> socket);
    boost::asio::awaitable<HttpResponse> respond(HttpRequest const& request);

public:
    TimelineServer(boost::asio::io_context& ioc, AmtrakClient& client,
                   TimelineRenderer const& renderer, ConfigurationManager const& config);

    void run();

    static QueryParse parseRequest(std::string_view target);
    static std::string percentDecode(std::string_view text);

    // 200 image/png, or 500 text when rendering or encoding fails.
    static HttpResponse renderResponse(HttpRequest const& request, TimelineRenderer const& renderer,
                                       RenderRequest const& renderRequest);
    static HttpResponse textResponse(HttpRequest const& request, unsigned status, std::string const& body);
};
