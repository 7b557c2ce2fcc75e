#include "s3sign/aws/s3/put_object.hpp"

#include "s3sign/aws/error.hpp"
#include "s3sign/aws/iam/request.hpp"
#include "s3sign/aws/iam/signer.hpp"

#include <boost/beast/http/field.hpp>
#include <boost/beast/http/verb.hpp>
#include <boost/describe/enum_to_string.hpp>
#include <boost/url/url_view.hpp>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <format>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>

namespace s3sign::aws::s3 {

Result<iam::RequestDescriptor> put_object_request(boost::urls::url_view endpoint,
                                                  const PutObjectParameters &parameters,
                                                  std::optional<std::uint64_t> content_length,
                                                  AddressingStyle_t style) {
    if (parameters.Bucket.empty()) {
        return fail(errc::invalid_request_descriptor, Stage::canonical_request, "empty bucket");
    }
    if (parameters.Key.empty()) {
        return fail(errc::invalid_request_descriptor, Stage::canonical_request, "empty object key");
    }
    if (!endpoint.has_authority() || endpoint.host().empty()) {
        return fail(errc::invalid_request_descriptor, Stage::canonical_request,
                    std::format("endpoint '{}' has no host", std::string_view{endpoint.buffer()}));
    }

    // the key is taken verbatim, a leading '/' is part of it
    const std::string_view key = parameters.Key;
    const std::string_view host_and_port = endpoint.encoded_host_and_port();

    iam::RequestDescriptor ret;
    ret.method = boost::beast::http::verb::put;
    if (style == AddressingStyle_t::virtual_host) {
        ret.host = std::format("{}.{}", parameters.Bucket, host_and_port);
        ret.path = std::format("/{}", key);
    } else {
        ret.host = host_and_port;
        ret.path = std::format("/{}/{}", parameters.Bucket, key);
    }

    if (content_length) {
        ret.headers.set(boost::beast::http::field::content_length, std::to_string(*content_length));
    }
    if (parameters.StorageClass) {
        ret.headers.set("x-amz-storage-class", boost::describe::enum_to_string(*parameters.StorageClass, ""));
    }
    if (parameters.ContentType) {
        ret.headers.set(boost::beast::http::field::content_type, *parameters.ContentType);
    }

    return ret;
}

Result<iam::SignedRequest> sign_put_object(const iam::Signer &signer, boost::urls::url_view endpoint,
                                           const PutObjectParameters &parameters,
                                           std::span<const std::byte> payload, AddressingStyle_t style,
                                           std::optional<std::chrono::sys_seconds> timestamp) {
    auto request = put_object_request(endpoint, parameters, payload.size(), style);
    if (!request) {
        return std::unexpected{std::move(request).error()};
    }
    if (timestamp) {
        return signer.sign(std::move(request).value(), payload, *timestamp);
    }
    return signer.sign(std::move(request).value(), payload);
}

} // namespace s3sign::aws::s3
