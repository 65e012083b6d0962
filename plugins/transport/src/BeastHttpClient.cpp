#include "BeastHttpClient.h"
#include "TransportError.h"
#include "LoggerMacros.h"

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <openssl/ssl.h>
#include <type_traits>

namespace CipherLink {
namespace Transport {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

namespace {

using Request = http::request<http::vector_body<uint8_t>>;
using TlsStream = beast::ssl_stream<beast::tcp_stream>;

TransportError toTransportError(const beast::error_code& ec, const std::string& step, const std::string& host) {
    if (ec == beast::error::timeout) {
        return TransportError(TransportError::Kind::Timeout, step + " to " + host + " timed out");
    }
    return TransportError(TransportError::Kind::Connection, step + " to " + host + " failed: " + ec.message());
}

// Drives the pending async operation to completion on the private io_context
void runStep(net::io_context& ioc, const beast::error_code& ec, const std::string& step, const std::string& host) {
    ioc.restart();
    ioc.run();
    if (ec) {
        throw toTransportError(ec, step, host);
    }
}

template<typename Stream>
HttpResponse exchange(net::io_context& ioc,
                      Stream& stream,
                      const tcp::resolver::results_type& endpoints,
                      Request& request,
                      const std::string& host,
                      std::chrono::milliseconds timeout,
                      std::size_t maxBodySize) {
    beast::tcp_stream& socket = beast::get_lowest_layer(stream);
    beast::error_code ec;

    socket.expires_after(timeout);
    socket.async_connect(endpoints, [&](beast::error_code e, const tcp::endpoint&) { ec = e; });
    runStep(ioc, ec, "connect", host);

    if constexpr (std::is_same_v<Stream, TlsStream>) {
        socket.expires_after(timeout);
        stream.async_handshake(ssl::stream_base::client, [&](beast::error_code e) { ec = e; });
        runStep(ioc, ec, "TLS handshake", host);
    }

    socket.expires_after(timeout);
    http::async_write(stream, request, [&](beast::error_code e, std::size_t) { ec = e; });
    runStep(ioc, ec, "write", host);

    beast::flat_buffer buffer;
    http::response_parser<http::vector_body<uint8_t>> parser;
    parser.body_limit(maxBodySize);
    socket.expires_after(timeout);
    http::async_read(stream, buffer, parser, [&](beast::error_code e, std::size_t) { ec = e; });
    runStep(ioc, ec, "read", host);

    auto message = parser.release();
    HttpResponse response;
    response.status = static_cast<int>(message.result_int());
    response.body = std::move(message.body());
    for (const auto& field : message) {
        response.headers[std::string(field.name_string())] = std::string(field.value());
    }

    beast::error_code closeEc;
    socket.socket().shutdown(tcp::socket::shutdown_both, closeEc);
    if (closeEc && closeEc != beast::errc::not_connected) {
        LOG_DEBUG_COMP_IF("Socket shutdown: " + closeEc.message(), "HttpClient");
    }
    return response;
}

} // namespace

HttpResponse BeastHttpClient::send(const HttpRequest& request) {
    Url url;
    try {
        url = Url::parse(request.url);
    } catch (const std::invalid_argument& e) {
        throw TransportError(TransportError::Kind::Protocol, e.what());
    }

    Request message{http::string_to_verb(request.method), url.target, 11};
    message.set(http::field::host, url.host);
    message.set(http::field::user_agent, "CipherLink/" BOOST_BEAST_VERSION_STRING);
    for (const auto& [name, value] : request.headers) {
        message.set(name, value);
    }
    message.body() = request.body;
    message.prepare_payload();

    LOG_DEBUG_COMP_IF(request.method + " " + url.host + url.target, "HttpClient");

    net::io_context ioc;
    tcp::resolver resolver(ioc);
    beast::error_code ec;
    tcp::resolver::results_type endpoints;
    resolver.async_resolve(url.host, url.port,
        [&](beast::error_code e, tcp::resolver::results_type results) {
            ec = e;
            endpoints = std::move(results);
        });
    runStep(ioc, ec, "resolve", url.host);

    if (!url.isTls()) {
        beast::tcp_stream stream(ioc);
        return exchange(ioc, stream, endpoints, message, url.host, request.timeout, maxBodySize_);
    }

    ssl::context ctx(ssl::context::tls_client);
    ctx.set_default_verify_paths();
    ctx.set_verify_mode(ssl::verify_peer);

    TlsStream stream(ioc, ctx);
    if (!SSL_set_tlsext_host_name(stream.native_handle(), url.host.c_str())) {
        throw TransportError(TransportError::Kind::Connection, "Failed to set SNI host name for " + url.host);
    }
    stream.set_verify_callback(ssl::host_name_verification(url.host));
    return exchange(ioc, stream, endpoints, message, url.host, request.timeout, maxBodySize_);
}

} // namespace Transport
} // namespace CipherLink
