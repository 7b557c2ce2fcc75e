#include "s3sign/aws/iam/sign_request.hpp"

#include "s3sign/aws/iam/digest.hpp"
#include "s3sign/aws/iam/string_to_sign.hpp"
#include "s3sign/aws/scope.hpp"

#include <cstdint>
#include <format>
#include <iterator>
#include <span>
#include <string>
#include <string_view>
#include <vector>

// see https://docs.aws.amazon.com/AmazonS3/latest/API/sig-v4-header-based-auth.html
// for the signing scheme

namespace s3sign::aws::iam {

std::vector<std::uint8_t> get_signing_key(std::string_view secret_access_key, const Scope &scope) {
    std::vector<std::uint8_t> hmac_key;

    hmac_key.reserve(256);
    std::format_to(std::back_inserter(hmac_key), "AWS4{}", secret_access_key);

    // DateKey
    hmac_key = hmac_sha256(hmac_key, scope.date);

    // DateRegionKey
    hmac_key = hmac_sha256(hmac_key, scope.region);

    // DateRegionServiceKey
    hmac_key = hmac_sha256(hmac_key, scope.service);

    // SigningKey
    return hmac_sha256(hmac_key, Scope::footer);
}

std::string signature(std::span<const std::uint8_t> signing_key, std::string_view string_to_sign) {
    return hmac_sha256_hex(signing_key, string_to_sign);
}

// NOLINTBEGIN(bugprone-easily-swappable-parameters)
std::string authorization_header(std::string_view access_key, const Scope &scope, std::string_view signed_headers,
                                 std::string_view signature) {
    return std::format("{} Credential={}/{}, SignedHeaders={}, Signature={}", algorithm, access_key, scope,
                       signed_headers, signature);
}

std::string sign_request(std::string_view access_key, std::string_view secret_access_key,
                         std::string_view canonical_request, std::string_view signed_headers,
                         std::string_view timestamp, const Scope &scope) {
    const std::string string_to_sign_ = string_to_sign(canonical_request, scope, timestamp);
    const std::string signature_ = signature(get_signing_key(secret_access_key, scope), string_to_sign_);

    return authorization_header(access_key, scope, signed_headers, signature_);
}
// NOLINTEND(bugprone-easily-swappable-parameters)

} // namespace s3sign::aws::iam
