#pragma once

#include "s3sign/aws/credentials.hpp"
#include "s3sign/aws/error.hpp"
#include "s3sign/aws/iam/request.hpp"
#include "s3sign/aws/iam/signing_key_cache.hpp"
#include "s3sign/aws/scope.hpp"

#include <boost/beast/http/fields.hpp> // IWYU pragma: keep
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <span>
#include <string>

//
#include "s3sign/internal/macro-begin.hpp"

namespace s3sign::aws::iam {

using ClockSource = std::function<Result<std::chrono::sys_seconds>()>;

[[nodiscard]] ClockSource system_clock_source();

struct SignerOptions {
    // S3 rejects requests without x-amz-content-sha256
    bool sign_content_sha256 = true;
    // adds Content-Length from the payload when the request has none
    bool sign_content_length = false;
};

struct SignedRequest {
    Scope scope;
    std::string timestamp;
    std::string payload_hash;
    CanonicalRequest canonical;
    std::string string_to_sign;
    std::string signature;
    std::string authorization;
    // everything that was signed plus Authorization, must be sent as is
    boost::beast::http::fields headers;
};

class Signer {
private:
    Credentials credentials_;
    std::string region_;
    std::string service_;
    SignerOptions options_;
    std::shared_ptr<SigningKeyCache> key_cache_;
    ClockSource clock_;

public:
    [[nodiscard]] Signer(Credentials credentials, std::string region, std::string service,
                         SignerOptions options = {}, std::shared_ptr<SigningKeyCache> key_cache = nullptr,
                         ClockSource clock = system_clock_source());

    [[nodiscard]] const std::string &region() const { return region_; }
    [[nodiscard]] const std::string &service() const { return service_; }
    [[nodiscard]] std::shared_ptr<SigningKeyCache> key_cache() const { return key_cache_; }

    // timestamp from the clock source
    [[nodiscard]] Result<SignedRequest> sign(RequestDescriptor request, std::span<const std::byte> payload) const;

    [[nodiscard]] Result<SignedRequest> sign(RequestDescriptor request, std::span<const std::byte> payload,
                                             std::chrono::sys_seconds timestamp) const;
};

} // namespace s3sign::aws::iam

//
#include "s3sign/internal/macro-end.hpp"
