#include "s3sign/aws/iam/string_to_sign.hpp"

#include "s3sign/aws/iam/digest.hpp"
#include "s3sign/aws/scope.hpp"

#include <chrono>
#include <format>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

namespace s3sign::aws::iam {

std::optional<std::chrono::sys_seconds> parse_timestamp(std::string_view timestamp) {
    if (timestamp.size() != 16) {
        return std::nullopt;
    }
    std::istringstream stream{std::string{timestamp}};
    std::chrono::sys_seconds ret;
    stream >> std::chrono::parse("%Y%m%dT%H%M%SZ", ret);
    if (stream.fail()) {
        return std::nullopt;
    }
    return ret;
}

std::string string_to_sign(std::string_view canonical_request, const Scope &scope, std::string_view timestamp) {
    return std::format("{}\n{}\n{}\n{}", algorithm, timestamp, scope, sha256_hex(canonical_request));
}

} // namespace s3sign::aws::iam
