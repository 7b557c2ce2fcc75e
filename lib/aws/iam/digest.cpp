#include "s3sign/aws/iam/digest.hpp"

#include "s3sign/meta.hpp"

#include <botan/hash.h>
#include <botan/hex.h>
#include <botan/mac.h>
#include <cassert>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace s3sign::aws::iam {

std::vector<std::uint8_t> sha256(std::span<const std::byte> data) {
    auto hash = Botan::HashFunction::create_or_throw("SHA-256");
    assert(hash != nullptr);
    hash->update(meta::safe_reinterpret_cast<const std::uint8_t *>(data.data()), data.size());
    return hash->final_stdvec();
}

std::string sha256_hex(std::span<const std::byte> data) { return Botan::hex_encode(sha256(data), false); }

std::vector<std::uint8_t> hmac_sha256(std::span<const std::uint8_t> key, std::span<const std::byte> message) {
    auto hmac = Botan::MessageAuthenticationCode::create_or_throw("HMAC(SHA-256)");
    assert(hmac != nullptr);
    hmac->set_key(key.data(), key.size());
    hmac->update(meta::safe_reinterpret_cast<const std::uint8_t *>(message.data()), message.size());
    return hmac->final_stdvec();
}

std::string hmac_sha256_hex(std::span<const std::uint8_t> key, std::span<const std::byte> message) {
    return Botan::hex_encode(hmac_sha256(key, message), false);
}

} // namespace s3sign::aws::iam
