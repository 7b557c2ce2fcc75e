#pragma once

#include "s3sign/meta.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

//
#include "s3sign/internal/macro-begin.hpp"

namespace s3sign::aws::iam {

// SHA-256 and HMAC(SHA-256) over raw bytes. Keys are always raw bytes, hex is
// only ever produced at the output boundary.

[[nodiscard]] std::vector<std::uint8_t> sha256(std::span<const std::byte> data);
[[nodiscard]] std::string sha256_hex(std::span<const std::byte> data);

[[nodiscard]] std::vector<std::uint8_t> hmac_sha256(std::span<const std::uint8_t> key,
                                                    std::span<const std::byte> message);
[[nodiscard]] std::string hmac_sha256_hex(std::span<const std::uint8_t> key, std::span<const std::byte> message);

[[nodiscard]] inline std::string sha256_hex(std::string_view data) { return sha256_hex(meta::as_bytes(data)); }

[[nodiscard]] inline std::vector<std::uint8_t> hmac_sha256(std::span<const std::uint8_t> key,
                                                           std::string_view message) {
    return hmac_sha256(key, meta::as_bytes(message));
}

[[nodiscard]] inline std::string hmac_sha256_hex(std::span<const std::uint8_t> key, std::string_view message) {
    return hmac_sha256_hex(key, meta::as_bytes(message));
}

} // namespace s3sign::aws::iam

//
#include "s3sign/internal/macro-end.hpp"
