#include "http_client.hpp"
#include "util.hpp"

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>

#ifdef OSU_RANKINGS_HAS_SSL
#include <boost/beast/ssl.hpp>
#include <boost/asio/ssl.hpp>
#endif

#include <iostream>
#include <stdexcept>

namespace beast = boost::beast;
namespace http  = beast::http;
namespace net   = boost::asio;
using tcp       = net::ip::tcp;

namespace osu_rankings {

namespace {

http::request<http::empty_body> buildRequest(const std::string& host,
                                             const std::string& target,
                                             const std::string& accessToken) {
    http::request<http::empty_body> req{http::verb::get, target, 11};
    req.set(http::field::host, host);
    req.set(http::field::accept, "application/json");
    req.set(http::field::user_agent, "osu_rankings/1.0");
    if (!accessToken.empty()) {
        req.set(http::field::authorization, "Bearer " + accessToken);
    }
    return req;
}

} // namespace

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

HttpClient::HttpClient(const std::string& baseUrl,
                       const std::string& accessToken,
                       int timeoutMs)
    : mAccessToken(accessToken)
    , mTimeoutMs(timeoutMs)
{
    auto parts = parseUrl(baseUrl);
    mHost     = parts.host;
    mPort     = parts.port;
    mBasePath = parts.target == "/" ? "" : parts.target;
    mUseSsl   = (parts.scheme == "https");

    if (mUseSsl) {
#ifndef OSU_RANKINGS_HAS_SSL
        throw std::runtime_error(
            "HTTPS endpoint requested but SSL support was not compiled in. "
            "Rebuild with OpenSSL to enable HTTPS.");
#endif
    }
}

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

HttpClient::Response HttpClient::get(const std::string& target) const
{
    const std::string fullTarget = mBasePath + target;

    if (mVerbose) {
        std::cerr << "[HttpClient] GET " << mHost << ":" << mPort
                  << fullTarget << "\n";
    }

    return mUseSsl ? doHttpsRequest(fullTarget) : doHttpRequest(fullTarget);
}

HttpClient::Response
HttpClient::toResponse(unsigned int status, const std::string& rawBody) const
{
    Response response;
    response.httpStatus = status;
    response.body = Json::parse(rawBody, nullptr, /*allow_exceptions=*/false);

    if (response.body.is_discarded()) {
        if (status >= 200 && status < 300) {
            throw std::runtime_error(
                "Failed to parse JSON response: " + rawBody.substr(0, 200));
        }
        response.body = rawBody;
    }

    if (mVerbose) {
        std::cerr << "[HttpClient] HTTP " << status << "\n";
    }
    return response;
}

// ---------------------------------------------------------------------------
// Plain HTTP
// ---------------------------------------------------------------------------

HttpClient::Response HttpClient::doHttpRequest(const std::string& target) const
{
    net::io_context ioc;
    tcp::resolver   resolver(ioc);
    beast::tcp_stream stream(ioc);

    // Resolve + connect with timeout.
    auto const results = resolver.resolve(mHost, mPort);
    stream.expires_after(std::chrono::milliseconds(mTimeoutMs));
    stream.connect(results);

    auto req = buildRequest(mHost, target, mAccessToken);
    http::write(stream, req);

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    stream.expires_after(std::chrono::milliseconds(mTimeoutMs));
    http::read(stream, buffer, res);

    // Shutdown errors after a complete response do not matter.
    beast::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);

    return toResponse(res.result_int(), res.body());
}

// ---------------------------------------------------------------------------
// HTTPS (compiled only when OpenSSL is available)
// ---------------------------------------------------------------------------

HttpClient::Response HttpClient::doHttpsRequest(const std::string& target) const
{
#ifdef OSU_RANKINGS_HAS_SSL
    namespace ssl = net::ssl;

    net::io_context ioc;
    ssl::context    ctx(ssl::context::tlsv12_client);
    ctx.set_default_verify_paths();
    ctx.set_verify_mode(ssl::verify_peer);

    tcp::resolver resolver(ioc);
    beast::ssl_stream<beast::tcp_stream> stream(ioc, ctx);

    // SNI hostname.
    if (!SSL_set_tlsext_host_name(stream.native_handle(), mHost.c_str())) {
        throw std::runtime_error("Failed to set SNI hostname");
    }

    auto const results = resolver.resolve(mHost, mPort);
    beast::get_lowest_layer(stream).expires_after(
        std::chrono::milliseconds(mTimeoutMs));
    beast::get_lowest_layer(stream).connect(results);

    stream.handshake(ssl::stream_base::client);

    auto req = buildRequest(mHost, target, mAccessToken);
    http::write(stream, req);

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    beast::get_lowest_layer(stream).expires_after(
        std::chrono::milliseconds(mTimeoutMs));
    http::read(stream, buffer, res);

    beast::error_code ec;
    stream.shutdown(ec);

    return toResponse(res.result_int(), res.body());
#else
    (void)target;
    throw std::runtime_error("HTTPS not supported: built without OpenSSL");
#endif
}

} // namespace osu_rankings
