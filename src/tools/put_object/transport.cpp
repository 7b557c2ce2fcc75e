#include "transport.hpp"

#include "s3sign/aws/iam/signer.hpp"

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <boost/beast/http/span_body.hpp>
#pragma GCC diagnostic pop

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/asio/ssl/stream_base.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/message.hpp> // IWYU pragma: keep
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/verb.hpp>
#include <boost/beast/http/write.hpp>
#include <boost/url/url_view.hpp>
#include <chrono>
#include <cstddef>
#include <expected>
#include <format>
#include <openssl/err.h>
#include <openssl/tls1.h>
#include <span>
#include <string>
#include <utility>
#include <variant>

namespace s3sign::tools::put_object {

namespace {

constexpr auto token = boost::asio::as_tuple(boost::asio::use_awaitable);

using PlainStream = boost::beast::tcp_stream;
using TlsStream = boost::asio::ssl::stream<boost::beast::tcp_stream>;
using Stream = std::variant<PlainStream, TlsStream>;

// resolves and connects to the endpoint, https endpoints also get SNI and a
// verified handshake
boost::asio::awaitable<std::expected<Stream, boost::beast::error_code>> open_stream(boost::urls::url_view endpoint,
                                                                                   boost::asio::ssl::context &ssl_ctx) {
    using rtype = std::expected<Stream, boost::beast::error_code>;

    const auto executor = co_await boost::asio::this_coro::executor;
    const std::string host = endpoint.host_name();
    const bool is_tls = endpoint.scheme() != "http";
    std::string service = endpoint.port();
    if (service.empty()) {
        service = is_tls ? "https" : "http";
    }

    boost::asio::ip::tcp::resolver resolver{executor};
    const auto [dns_ec, resolved] = co_await resolver.async_resolve(host, service, token);
    if (dns_ec.failed()) {
        co_return rtype{std::unexpect, dns_ec};
    }

    Stream stream = is_tls ? Stream{std::in_place_type<TlsStream>, executor, ssl_ctx}
                           : Stream{std::in_place_type<PlainStream>, executor};
    auto &tcp = std::visit([](auto &stream_) -> PlainStream & { return boost::beast::get_lowest_layer(stream_); },
                           stream);
    tcp.expires_after(std::chrono::seconds{300});

    if (const auto [con_ec, con_ep] = co_await tcp.async_connect(resolved, token); con_ec.failed()) {
        co_return rtype{std::unexpect, con_ec};
    }

    if (auto *tls = std::get_if<TlsStream>(&stream); tls != nullptr) {
        if (SSL_set_tlsext_host_name(tls->native_handle(), host.c_str()) != 1) {
            co_return rtype{std::unexpect, boost::beast::error_code{static_cast<int>(::ERR_get_error()),
                                                                    boost::asio::error::get_ssl_category()}};
        }
        tls->set_verify_callback(boost::asio::ssl::host_name_verification{host});
        if (const auto [shake_ec] = co_await tls->async_handshake(boost::asio::ssl::stream_base::client, token);
            shake_ec.failed()) {
            co_return rtype{std::unexpect, shake_ec};
        }
    }

    co_return rtype{std::move(stream)};
}

} // namespace

boost::asio::awaitable<std::expected<Response, boost::beast::error_code>>
send(boost::urls::url_view endpoint, boost::beast::http::verb method, const aws::iam::SignedRequest &request,
     std::span<const std::byte> body, boost::asio::ssl::context &ssl_ctx) {
    using rtype = std::expected<Response, boost::beast::error_code>;

    std::string target = request.canonical.uri;
    if (!request.canonical.query.empty()) {
        target = std::format("{}?{}", target, request.canonical.query);
    }

    // the signed fields already carry Content-Length, Host and Authorization
    boost::beast::http::request<boost::beast::http::span_body<const std::byte>> http_request{
        method, target, 11, body, request.headers};

    auto opened = co_await open_stream(endpoint, ssl_ctx);
    if (!opened) {
        co_return rtype{std::unexpect, opened.error()};
    }
    auto stream = std::move(opened).value();

    boost::beast::flat_buffer buf;
    Response response;

    const auto [send_ec, send_n] = co_await std::visit(
        [&http_request](auto &stream_) { return boost::beast::http::async_write(stream_, http_request, token); },
        stream);
    if (send_ec.failed()) {
        co_return rtype{std::unexpect, send_ec};
    }

    const auto [recv_ec, recv_n] = co_await std::visit(
        [&buf, &response](auto &stream_) {
            // NOLINTNEXTLINE(clang-analyzer-core.NullDereference)
            return boost::beast::http::async_read(stream_, buf, response, token);
        },
        stream);
    if (recv_ec.failed()) {
        co_return rtype{std::unexpect, recv_ec};
    }

    co_return response;
}

} // namespace s3sign::tools::put_object
