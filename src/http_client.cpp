#include "http_client.hpp"
#include "errors.hpp"

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>

#ifdef TOPSELLERS_HAS_SSL
#include <boost/beast/ssl.hpp>
#include <boost/asio/ssl.hpp>
#endif

#include <chrono>
#include <iostream>
#include <stdexcept>

namespace beast = boost::beast;
namespace http  = beast::http;
namespace net   = boost::asio;
using tcp       = net::ip::tcp;

namespace topsellers {

namespace {

http::request<http::empty_body> makeRequest(const std::string& host,
                                            const std::string& target) {
    http::request<http::empty_body> req{http::verb::get, target, 11};
    req.set(http::field::host, host);
    req.set(http::field::accept, "application/json");
    req.set(http::field::user_agent, "topsellers/1.0");
    return req;
}

/// Write @p req and read the full response on an already connected stream.
/// The caller has armed the stream timer.
template <class Stream>
HttpClient::Response exchange(Stream& stream,
                              const http::request<http::empty_body>& req) {
    http::write(stream, req);

    beast::flat_buffer buffer;
    http::response_parser<http::string_body> parser;
    parser.body_limit(16 * 1024 * 1024);
    http::read(stream, buffer, parser);

    auto res = parser.release();
    HttpClient::Response response;
    response.httpStatus = res.result_int();
    response.body       = std::move(res.body());
    return response;
}

} // namespace

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

HttpClient::HttpClient(const std::string& baseUrl, int timeoutMs)
    : mTimeoutMs(timeoutMs)
{
    if (timeoutMs <= 0) {
        throw std::invalid_argument("HttpClient timeout must be positive");
    }

    auto parts = parseUrl(baseUrl);
    mHost     = parts.host;
    mPort     = parts.port;
    mBasePath = parts.target;
    mUseSsl   = (parts.scheme == "https");

    if (mUseSsl) {
#ifndef TOPSELLERS_HAS_SSL
        throw std::runtime_error(
            "HTTPS endpoint requested but SSL support was not compiled in. "
            "Rebuild with OpenSSL to enable HTTPS.");
#endif
    }
}

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

HttpClient::Response
HttpClient::get(const std::string& path, const QueryParams& params) const
{
    std::string target = joinPath(mBasePath, path);
    if (!params.empty()) {
        target += '?';
        target += buildQueryString(params);
    }

    if (mVerbose) {
        std::cerr << std::string("[HttpClient] GET ") + mHost + ":" + mPort +
                         target + "\n";
    }

    try {
        return mUseSsl ? doHttpsRequest(target) : doHttpRequest(target);
    } catch (const boost::system::system_error& e) {
        if (e.code() == beast::error::timeout) {
            throw TransportError("timed out after " +
                                 std::to_string(mTimeoutMs) + " ms (" +
                                 mHost + target + ")");
        }
        throw TransportError(std::string(e.what()) + " (" + mHost + target + ")");
    }
}

// ---------------------------------------------------------------------------
// Plain HTTP
// ---------------------------------------------------------------------------

HttpClient::Response
HttpClient::doHttpRequest(const std::string& target) const
{
    net::io_context   ioc;
    tcp::resolver     resolver(ioc);
    beast::tcp_stream stream(ioc);

    // Blocking getaddrinfo; not covered by the deadline below.
    auto const results = resolver.resolve(mHost, mPort);

    // One deadline covers connect, write and read.
    stream.expires_after(std::chrono::milliseconds(mTimeoutMs));
    stream.connect(results);

    auto response = topsellers::exchange(stream, makeRequest(mHost, target));

    if (mVerbose) {
        std::cerr << "[HttpClient] HTTP " + std::to_string(response.httpStatus) +
                         " " + target + "\n";
    }

    // Graceful shutdown (non-critical errors are ignored).
    beast::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);

    return response;
}

// ---------------------------------------------------------------------------
// HTTPS (compiled only when OpenSSL is available)
// ---------------------------------------------------------------------------

HttpClient::Response
HttpClient::doHttpsRequest(const std::string& target) const
{
#ifdef TOPSELLERS_HAS_SSL
    namespace ssl = net::ssl;

    net::io_context ioc;
    ssl::context    ctx(ssl::context::tlsv12_client);
    ctx.set_default_verify_paths();
    ctx.set_verify_mode(ssl::verify_peer);

    tcp::resolver resolver(ioc);
    beast::ssl_stream<beast::tcp_stream> stream(ioc, ctx);

    // SNI hostname.
    if (!SSL_set_tlsext_host_name(stream.native_handle(), mHost.c_str())) {
        throw TransportError("Failed to set SNI hostname for " + mHost);
    }

    auto const results = resolver.resolve(mHost, mPort);
    beast::get_lowest_layer(stream).expires_after(
        std::chrono::milliseconds(mTimeoutMs));
    beast::get_lowest_layer(stream).connect(results);

    stream.handshake(ssl::stream_base::client);

    auto response = topsellers::exchange(stream, makeRequest(mHost, target));

    if (mVerbose) {
        std::cerr << "[HttpClient] HTTPS " + std::to_string(response.httpStatus) +
                         " " + target + "\n";
    }

    // Servers commonly skip close_notify; a truncated shutdown is harmless here.
    beast::error_code ec;
    stream.shutdown(ec);

    return response;
#else
    (void)target;
    throw std::runtime_error("HTTPS not supported: built without OpenSSL");
#endif
}

} // namespace topsellers
