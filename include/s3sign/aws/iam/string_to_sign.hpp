#pragma once

#include "s3sign/aws/scope.hpp"
#include "s3sign/meta.hpp"

#include <chrono>
#include <format>
#include <optional>
#include <string>
#include <string_view>

//
#include "s3sign/internal/macro-begin.hpp"

namespace s3sign::aws::iam {

constexpr std::string_view algorithm = "AWS4-HMAC-SHA256";

// ISO 8601 basic format, YYYYMMDDTHHMMSSZ
template <typename T>
    requires meta::is_specialization_v<T, std::chrono::time_point>
[[nodiscard]] std::string format_timestamp(const T &time) {
    // system_clock is UTC, sub-second precision would leak into %S
    return std::format("{:%Y%m%dT%H%M%SZ}", std::chrono::floor<std::chrono::seconds>(time));
}

[[nodiscard]] std::optional<std::chrono::sys_seconds> parse_timestamp(std::string_view timestamp);

[[nodiscard]] std::string string_to_sign(std::string_view canonical_request, const Scope &scope,
                                         std::string_view timestamp);

} // namespace s3sign::aws::iam

//
#include "s3sign/internal/macro-end.hpp"
