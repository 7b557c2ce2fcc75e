#pragma once

#include "s3sign/aws/scope.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

//
#include "s3sign/internal/macro-begin.hpp"

namespace s3sign::aws::iam {

// HMAC chain over date, region, service and the scope footer. Every step is keyed
// with the raw output of the previous one.
[[nodiscard]] std::vector<std::uint8_t> get_signing_key(std::string_view secret_access_key, const Scope &scope);

// lowercase hex
[[nodiscard]] std::string signature(std::span<const std::uint8_t> signing_key, std::string_view string_to_sign);

[[nodiscard]] std::string authorization_header(std::string_view access_key, const Scope &scope,
                                               std::string_view signed_headers, std::string_view signature);

[[nodiscard]] std::string sign_request(std::string_view access_key, std::string_view secret_access_key,
                                       std::string_view canonical_request, std::string_view signed_headers,
                                       std::string_view timestamp, const Scope &scope);

} // namespace s3sign::aws::iam

//
#include "s3sign/internal/macro-end.hpp"
