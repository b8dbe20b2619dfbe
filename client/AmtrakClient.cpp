#include "ConfigurationManager.hpp"
#include "Errors.hpp"
#include "ProviderParser.hpp"
#include "AmtrakClient.hpp"

AmtrakClient::AmtrakClient(boost::asio::io_context& ioc)
    : ioContext(ioc)
    , sslContext(boost::asio::ssl::context::tlsv12_client)
{
    sslContext.set_options(
        boost::asio::ssl::context::default_workarounds
        | boost::asio::ssl::context::no_sslv2
        | boost::asio::ssl::context::single_dh_use
    );

    sslContext.set_default_verify_paths();
    sslContext.set_verify_mode(boost::asio::ssl::verify_peer);
}

void AmtrakClient::configureTlsStream(boost::beast::ssl_stream<boost::beast::tcp_stream>& stream)
{
    if (!SSL_set_tlsext_host_name(stream.native_handle(), ConfigurationManager::AMTRAK_HOST.c_str()))
    {
        throw boost::beast::system_error(boost::system::error_code(static_cast<int>(::ERR_get_error()), boost::asio::error::get_ssl_category()),"Failed to set SNI");
    }
    stream.set_verify_callback(boost::asio::ssl::host_name_verification(ConfigurationManager::AMTRAK_HOST));
}

boost::asio::awaitable<void> AmtrakClient::connect(boost::beast::ssl_stream<boost::beast::tcp_stream>& stream)
{
    boost::asio::ip::tcp::resolver resolver(ioContext);
    auto endpoints = co_await resolver.async_resolve(ConfigurationManager::AMTRAK_HOST, ConfigurationManager::AMTRAK_PORT,
                                                     boost::asio::use_awaitable);

    auto& tcp = boost::beast::get_lowest_layer(stream);
    tcp.expires_after(REQUEST_TIMEOUT);
    co_await tcp.async_connect(endpoints, boost::asio::use_awaitable);
    co_await stream.async_handshake(boost::asio::ssl::stream_base::client, boost::asio::use_awaitable);
}

boost::beast::http::request<boost::beast::http::string_body> AmtrakClient::buildGetRequest(std::string const& target)
{
    boost::beast::http::request<boost::beast::http::string_body> request(boost::beast::http::verb::get, target, 11);
    request.set(boost::beast::http::field::host, ConfigurationManager::AMTRAK_HOST);
    request.set(boost::beast::http::field::user_agent, BOOST_BEAST_VERSION_STRING);
    request.set(boost::beast::http::field::accept, "application/json");

    return request;
}

boost::asio::awaitable<void> AmtrakClient::shutdownStream(boost::beast::ssl_stream<boost::beast::tcp_stream>& stream)
{
    // Servers commonly drop the connection without close_notify.
    boost::system::error_code ec;
    co_await stream.async_shutdown(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    co_return;
}

boost::asio::awaitable<std::string> AmtrakClient::fetch(std::string target)
{
    boost::beast::http::response<boost::beast::http::string_body> response;
    try
    {
        auto executor = co_await boost::asio::this_coro::executor;
        boost::beast::ssl_stream<boost::beast::tcp_stream> stream(executor, sslContext);

        configureTlsStream(stream);
        co_await connect(stream);

        auto request = buildGetRequest(target);
        co_await boost::beast::http::async_write(stream, request, boost::asio::use_awaitable);

        boost::beast::flat_buffer buffer;
        boost::beast::get_lowest_layer(stream).expires_after(REQUEST_TIMEOUT);
        co_await boost::beast::http::async_read(stream, buffer, response, boost::asio::use_awaitable);

        co_await shutdownStream(stream);
    }
    catch (boost::system::system_error const& e)
    {
        throw ProviderError("GET " + target + " failed: " + e.what());
    }

    if (response.result() != boost::beast::http::status::ok)
    {
        throw ProviderError("GET " + target + " returned HTTP " + std::to_string(response.result_int()));
    }

    co_return response.body();
}

boost::asio::awaitable<std::vector<std::string>> AmtrakClient::fetchStation(std::string code)
{
    std::string body = co_await fetch(ConfigurationManager::API_PREFIX + "/stations/" + code);
    co_return ProviderParser::parseStation(body, code);
}

boost::asio::awaitable<std::optional<ProviderTrain>> AmtrakClient::fetchTrain(std::string trainId)
{
    std::string body = co_await fetch(ConfigurationManager::API_PREFIX + "/trains/" + trainId);
    co_return ProviderParser::parseTrain(body, trainId);
}
