#include "s3sign/aws/iam/signer.hpp"

#include "s3sign/aws/credentials.hpp"
#include "s3sign/aws/error.hpp"
#include "s3sign/aws/iam/canonicalize.hpp"
#include "s3sign/aws/iam/digest.hpp"
#include "s3sign/aws/iam/request.hpp"
#include "s3sign/aws/iam/sign_request.hpp"
#include "s3sign/aws/iam/signing_key_cache.hpp"
#include "s3sign/aws/iam/string_to_sign.hpp"
#include "s3sign/aws/scope.hpp"

#include <boost/beast/http/field.hpp>
#include <boost/beast/http/fields.hpp> // IWYU pragma: keep
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <format>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace s3sign::aws::iam {

namespace {

// A caller supplied value has to agree with ours. A missing header is only
// filled in when add_missing is set.
[[nodiscard]] Result<void> finalize_header(boost::beast::http::fields &headers, std::string_view name,
                                           std::string_view value, Stage stage, bool add_missing = true) {
    if (const auto iter = headers.find(name); iter != headers.end()) {
        if (normalize_header_value(iter->value()) != value) {
            return fail(errc::invalid_request_descriptor, stage,
                        std::format("{} '{}' disagrees with computed '{}'", name,
                                    static_cast<std::string_view>(iter->value()), value));
        }
        return {};
    }
    if (add_missing) {
        headers.set(name, value);
    }
    return {};
}

} // namespace

ClockSource system_clock_source() {
    return []() -> Result<std::chrono::sys_seconds> {
        return std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now());
    };
}

Signer::Signer(Credentials credentials, std::string region, std::string service, SignerOptions options,
               std::shared_ptr<SigningKeyCache> key_cache, ClockSource clock)
    : credentials_{std::move(credentials)}, region_{std::move(region)}, service_{std::move(service)},
      options_{options}, key_cache_{std::move(key_cache)}, clock_{std::move(clock)} {}

Result<SignedRequest> Signer::sign(RequestDescriptor request, std::span<const std::byte> payload) const {
    if (!clock_) {
        return fail(errc::clock_source_error, Stage::clock, "no clock source");
    }
    const auto now = clock_();
    if (!now) {
        return std::unexpected{now.error()};
    }
    return sign(std::move(request), payload, *now);
}

Result<SignedRequest> Signer::sign(RequestDescriptor request, std::span<const std::byte> payload,
                                   std::chrono::sys_seconds timestamp) const {
    if (credentials_.access_key.empty()) {
        return fail(errc::missing_credential, Stage::credentials, "access key id");
    }
    if (credentials_.secret_access_key.empty()) {
        return fail(errc::missing_credential, Stage::credentials, "secret access key");
    }

    SignedRequest ret;
    ret.timestamp = format_timestamp(timestamp);

    auto scope = make_scope(timestamp, region_, service_);
    if (!scope) {
        return std::unexpected{std::move(scope).error()};
    }
    ret.scope = std::move(scope).value();

    ret.payload_hash = sha256_hex(payload);
    if (auto res = finalize_header(request.headers, "x-amz-content-sha256", ret.payload_hash, Stage::payload,
                                   options_.sign_content_sha256);
        !res) {
        return std::unexpected{std::move(res).error()};
    }
    // the body goes out unmodified, so a given content-length must match it
    if (auto res = finalize_header(request.headers, "content-length", std::to_string(payload.size()),
                                   Stage::payload, options_.sign_content_length);
        !res) {
        return std::unexpected{std::move(res).error()};
    }
    // x-amz-date and the scope date come from the same timestamp
    if (auto res = finalize_header(request.headers, "x-amz-date", ret.timestamp, Stage::canonical_request); !res) {
        return std::unexpected{std::move(res).error()};
    }

    auto canonical = canonicalize_request(request, ret.payload_hash);
    if (!canonical) {
        return std::unexpected{std::move(canonical).error()};
    }
    ret.canonical = std::move(canonical).value();

    ret.string_to_sign = string_to_sign(ret.canonical.request, ret.scope, ret.timestamp);

    if (key_cache_ != nullptr) {
        const SigningKeyCache::Key key = key_cache_->get(credentials_, ret.scope);
        ret.signature = signature(*key, ret.string_to_sign);
    } else {
        const std::vector<std::uint8_t> key = get_signing_key(credentials_.secret_access_key, ret.scope);
        ret.signature = signature(key, ret.string_to_sign);
    }

    ret.authorization =
        authorization_header(credentials_.access_key, ret.scope, ret.canonical.signed_headers, ret.signature);

    for (const auto &[name, value] : ret.canonical.headers) {
        ret.headers.insert(name, value);
    }
    ret.headers.set(boost::beast::http::field::authorization, ret.authorization);

    return ret;
}

} // namespace s3sign::aws::iam
