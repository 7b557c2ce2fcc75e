#pragma once

#include "s3sign/aws/iam/signer.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/http/message.hpp>     // IWYU pragma: keep
#include <boost/beast/http/string_body.hpp> // IWYU pragma: keep
#include <boost/beast/http/verb.hpp>
#include <boost/url/url_view.hpp>
#include <cstddef>
#include <expected>
#include <span>

namespace s3sign::tools::put_object {

using Response = boost::beast::http::response<boost::beast::http::string_body>;

// Sends the signed request without touching any of its headers. For https
// endpoints the peer certificate must be valid for the endpoint host.
[[nodiscard]] boost::asio::awaitable<std::expected<Response, boost::beast::error_code>>
send(boost::urls::url_view endpoint, boost::beast::http::verb method, const aws::iam::SignedRequest &request,
     std::span<const std::byte> body, boost::asio::ssl::context &ssl_ctx);

} // namespace s3sign::tools::put_object
