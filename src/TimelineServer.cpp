#include <cctype>
#include <iostream>
#include <map>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/this_coro.hpp>
#include "AmtrakClient.hpp"
#include "ConfigurationManager.hpp"
#include "Errors.hpp"
#include "PngEncoder.hpp"
#include "SegmentExtractor.hpp"
#include "TimelineRenderer.hpp"
#include "TrainFinder.hpp"
#include "VirtualClock.hpp"
#include "TimelineServer.hpp"

namespace http = boost::beast::http;

namespace
{
    std::string trim(std::string_view text)
    {
        auto begin = text.find_first_not_of(" \t");
        if (begin == std::string_view::npos)
            return {};
        auto end = text.find_last_not_of(" \t");
        return std::string(text.substr(begin, end - begin + 1));
    }

    std::vector<std::string> split(std::string_view text, char sep)
    {
        std::vector<std::string> parts;
        std::size_t start = 0;
        while (start <= text.size())
        {
            auto pos = text.find(sep, start);
            if (pos == std::string_view::npos)
                pos = text.size();
            parts.emplace_back(text.substr(start, pos - start));
            start = pos + 1;
        }
        return parts;
    }

    std::optional<int> parseMinutes(std::string const& text)
    {
        if (text.empty())
            return std::nullopt;

        std::size_t used = 0;
        int value = 0;
        try
        {
            value = std::stoi(text, &used);
        }
        catch (std::exception const&)
        {
            return std::nullopt;
        }
        if (used != text.size())
            return std::nullopt;
        return value;
    }
}

TimelineServer::TimelineServer(boost::asio::io_context& ioc, AmtrakClient& c,
                               TimelineRenderer const& r, ConfigurationManager const& cfg)
    : ioContext(ioc)
    , client(c)
    , renderer(r)
    , config(cfg)
{
}

std::string TimelineServer::percentDecode(std::string_view text)
{
    std::string out;
    out.reserve(text.size());

    for (std::size_t i = 0; i < text.size(); ++i)
    {
        char c = text[i];
        if (c == '+')
        {
            out += ' ';
        }
        else if (c == '%' && i + 2 < text.size() && std::isxdigit(static_cast<unsigned char>(text[i + 1]))
                 && std::isxdigit(static_cast<unsigned char>(text[i + 2])))
        {
            out += static_cast<char>(std::stoi(std::string(text.substr(i + 1, 2)), nullptr, 16));
            i += 2;
        }
        else
        {
            out += c;
        }
    }
    return out;
}

QueryParse TimelineServer::parseRequest(std::string_view target)
{
    QueryParse result;

    auto mark = target.find('?');
    std::string_view path = target.substr(0, mark);
    std::string_view query = mark == std::string_view::npos ? std::string_view{} : target.substr(mark + 1);

    std::map<std::string, std::string> params;
    if (!query.empty())
    {
        for (const auto& pair : split(query, '&'))
        {
            if (pair.empty())
                continue;
            auto eq = pair.find('=');
            auto key = percentDecode(std::string_view(pair).substr(0, eq));
            auto value = eq == std::string::npos ? std::string{} : percentDecode(std::string_view(pair).substr(eq + 1));
            params.emplace(key, value);
        }
    }

    TimelineQuery q;
    if (path == "/trains")
    {
        auto it = params.find("stations");
        if (it == params.end() || trim(it->second).empty())
        {
            result.status = 400;
            result.error = "Missing 'stations' parameter";
            return result;
        }
        for (const auto& code : split(it->second, ','))
        {
            auto cleaned = trim(code);
            if (!cleaned.empty())
                q.stations.push_back(SegmentExtractor::normalizeCode(cleaned));
        }
    }
    else if (path.substr(0, 8) == "/trains/")
    {
        for (const auto& part : split(path.substr(8), '/'))
        {
            auto cleaned = trim(percentDecode(part));
            if (!cleaned.empty())
                q.stations.push_back(SegmentExtractor::normalizeCode(cleaned));
        }
    }
    else
    {
        result.status = 404;
        result.error = "Not found. Use /trains?stations=NYP,NWK,PHL or /trains/NYP/NWK/PHL";
        return result;
    }

    if (q.stations.size() < 2)
    {
        result.status = 400;
        result.error = "Need at least 2 stations";
        return result;
    }

    for (auto [name, field] : {std::pair{"buffer_before", &q.bufferBefore}, std::pair{"buffer_after", &q.bufferAfter}})
    {
        auto it = params.find(name);
        if (it == params.end())
            continue;

        auto minutes = parseMinutes(it->second);
        if (!minutes)
        {
            result.status = 400;
            result.error = "buffer_before and buffer_after must be integers";
            return result;
        }
        if (*minutes < 0)
        {
            result.status = 400;
            result.error = "buffer_before and buffer_after must not be negative";
            return result;
        }
        *field = std::chrono::minutes(*minutes);
    }

    result.query = std::move(q);
    return result;
}

boost::asio::awaitable<TimelineDocument> TimelineServer::refreshRoute(std::vector<std::string> stations)
{
    std::cout << "[Cache] Refreshing data for " << RouteCache::keyFor(stations) << "..." << std::endl;

    TimelineDocument doc;
    doc.stations = stations;
    doc.trains = co_await TrainFinder::find(client, stations);

    cache.store(doc, VirtualClock::now());
    co_return doc;
}

boost::asio::awaitable<TimelineDocument> TimelineServer::getRoute(std::vector<std::string> stations)
{
    if (auto cached = cache.lookup(stations))
    {
        std::cout << "[Cache] Hit for " << RouteCache::keyFor(stations) << std::endl;
        co_return *cached;
    }

    std::cout << "[Cache] Cold start for " << RouteCache::keyFor(stations) << ", fetching..." << std::endl;
    co_return co_await refreshRoute(stations);
}

boost::asio::awaitable<void> TimelineServer::refreshLoop()
{
    boost::asio::steady_timer timer(ioContext);

    for (;;)
    {
        timer.expires_after(config.getRefreshInterval());
        co_await timer.async_wait(boost::asio::use_awaitable);

        for (const auto& stations : cache.registeredRoutes())
        {
            std::string failure;
            try
            {
                co_await refreshRoute(stations);
            }
            catch (std::exception const& e)
            {
                failure = e.what();
            }

            if (!failure.empty())
                std::cerr << "[Cache] Background refresh failed for " << RouteCache::keyFor(stations)
                          << ": " << failure << std::endl;
        }
    }
}

TimelineServer::HttpResponse TimelineServer::textResponse(HttpRequest const& request, unsigned status, std::string const& body)
{
    HttpResponse response{static_cast<http::status>(status), request.version()};
    response.set(http::field::server, BOOST_BEAST_VERSION_STRING);
    response.set(http::field::content_type, "text/plain");
    response.keep_alive(false);
    response.body() = body + "\n";
    response.prepare_payload();
    return response;
}

boost::asio::awaitable<TimelineServer::HttpResponse> TimelineServer::respond(HttpRequest const& request)
{
    if (request.method() != http::verb::get)
        co_return textResponse(request, 405, "Only GET is supported");

    auto parsed = parseRequest(std::string_view(request.target().data(), request.target().size()));
    if (!parsed.query)
        co_return textResponse(request, parsed.status, parsed.error);

    TimelineDocument doc;
    std::string failure;
    unsigned failureStatus = 0;
    try
    {
        doc = co_await getRoute(parsed.query->stations);
    }
    catch (ProviderError const& e)
    {
        failure = e.what();
        failureStatus = 502;
    }
    catch (std::exception const& e)
    {
        failure = e.what();
        failureStatus = 500;
    }

    if (failureStatus == 502)
    {
        std::cerr << "[Server] Upstream failure: " << failure << std::endl;
        co_return textResponse(request, 502, "Upstream train data unavailable");
    }
    if (failureStatus == 500)
    {
        std::cerr << "[Server] Route lookup failure: " << failure << std::endl;
        co_return textResponse(request, 500, "Internal error");
    }

    // Data may be stale; the clock is always read fresh.
    auto now = VirtualClock::now();
    RenderRequest renderRequest{doc.trains, doc.stations, now,
                                parsed.query->bufferBefore, parsed.query->bufferAfter,
                                cache.maxAge(now)};
    co_return renderResponse(request, renderer, renderRequest);
}

TimelineServer::HttpResponse TimelineServer::renderResponse(HttpRequest const& request, TimelineRenderer const& renderer,
                                                            RenderRequest const& renderRequest)
{
    std::string png;
    try
    {
        png = PngEncoder::encode(renderer.render(renderRequest));
    }
    catch (std::exception const& e)
    {
        std::cerr << "[Server] Render failure: " << e.what() << std::endl;
        return textResponse(request, 500, "Timeline could not be rendered");
    }

    HttpResponse response{http::status::ok, request.version()};
    response.set(http::field::server, BOOST_BEAST_VERSION_STRING);
    response.set(http::field::content_type, "image/png");
    response.set(http::field::cache_control, "no-cache");
    response.keep_alive(false);
    response.body() = std::move(png);
    response.prepare_payload();
    return response;
}

boost::asio::awaitable<void> TimelineServer::handleClient(std::shared_ptr<boost::asio::ip::tcp::socket> socket)
{
    try
    {
        boost::beast::flat_buffer buffer;
        HttpRequest request;
        co_await http::async_read(*socket, buffer, request, boost::asio::use_awaitable);

        HttpResponse response = co_await respond(request);
        std::cout << "[Server] " << socket->remote_endpoint().address().to_string() << " - "
                  << request.target() << " " << response.result_int() << std::endl;

        co_await http::async_write(*socket, response, boost::asio::use_awaitable);

        boost::system::error_code ignore;
        socket->shutdown(boost::asio::ip::tcp::socket::shutdown_both, ignore);
    }
    catch (boost::system::system_error const& e)
    {
        auto code = e.code();
        if (code == boost::asio::error::operation_aborted ||
            code == boost::asio::error::connection_reset ||
            code == boost::asio::error::connection_aborted ||
            code == boost::asio::error::eof ||
            code == http::error::end_of_stream)
        {
            co_return;
        }

        std::cerr << "[Server] HTTP handler error: " << e.what() << "\n";
    }
    catch (std::exception const& e)
    {
        std::cerr << "[Server] HTTP handler error: " << e.what() << "\n";
    }
}

boost::asio::awaitable<void> TimelineServer::acceptLoop(boost::asio::ip::tcp::acceptor& acceptor)
{
    for (;;)
    {
        auto socket = std::make_shared<boost::asio::ip::tcp::socket>(co_await boost::asio::this_coro::executor);

        co_await acceptor.async_accept(*socket, boost::asio::use_awaitable);
        boost::asio::co_spawn(socket->get_executor(), handleClient(socket), boost::asio::detached);
    }
}

void TimelineServer::run()
{
    boost::asio::ip::tcp::acceptor acceptor(ioContext, {boost::asio::ip::tcp::v4(), config.getPort()});

    std::cout << "[Server] Running on http://localhost:" << config.getPort() << "\n";
    std::cout << "[Server] Example: http://localhost:" << config.getPort() << "/trains?stations=NYP,NWK,PHL\n";
    std::cout << "[Server]      or: http://localhost:" << config.getPort() << "/trains/NYP/NWK/PHL?buffer_before=15&buffer_after=20\n";
    std::cout << "[Cache] Background refresh every " << config.getRefreshInterval().count() << "s" << std::endl;

    boost::asio::co_spawn(ioContext, acceptLoop(acceptor), boost::asio::detached);
    boost::asio::co_spawn(ioContext, refreshLoop(), boost::asio::detached);

    ioContext.run();
}
