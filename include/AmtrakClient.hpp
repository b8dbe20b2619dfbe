#pragma once
#include <string>
#include <vector>
#include <optional>
#include <chrono>
#include <boost/asio.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast.hpp>
#include <boost/beast/ssl.hpp>
#include "Types.hpp"

class AmtrakClient
{
private:
    boost::asio::io_context& ioContext;
    boost::asio::ssl::context sslContext;
    void configureTlsStream(boost::beast::ssl_stream<boost::beast::tcp_stream>& stream);
    // Resolve, TCP connect and TLS handshake.
    boost::asio::awaitable<void> connect(boost::beast::ssl_stream<boost::beast::tcp_stream>& stream);
    boost::asio::awaitable<void> shutdownStream(boost::beast::ssl_stream<boost::beast::tcp_stream>& stream);

public:
    // Applies to the connect and to reading the response.
    static constexpr std::chrono::seconds REQUEST_TIMEOUT{30};

    static boost::beast::http::request<boost::beast::http::string_body> buildGetRequest(std::string const& target);

    explicit AmtrakClient(boost::asio::io_context& ioc);

    // Body of a 200 response; anything else raises ProviderError.
    boost::asio::awaitable<std::string> fetch(std::string target);

    boost::asio::awaitable<std::vector<std::string>> fetchStation(std::string code);
    boost::asio::awaitable<std::optional<ProviderTrain>> fetchTrain(std::string trainId);
};
