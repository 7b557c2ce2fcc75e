#include "s3sign/aws/iam/digest.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <format>
#include <iostream>
#include <iterator>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace {

[[nodiscard]] std::string to_hex(std::span<const std::uint8_t> data) {
    std::string ret;
    for (const auto byte : data) {
        std::format_to(std::back_inserter(ret), "{:02x}", byte);
    }
    return ret;
}

} // namespace

// NOLINTNEXTLINE(bugprone-exception-escape)
int main() {
    using namespace s3sign::aws::iam;

    // FIPS 180-2
    if (const auto empty = sha256_hex(std::span<const std::byte>{});
        empty != "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855") {
        std::cerr << "sha256_hex of nothing failed, got " << empty << "\n";
        return 1;
    }
    if (const auto abc = sha256_hex("abc");
        abc != "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad") {
        std::cerr << "sha256_hex(abc) failed, got " << abc << "\n";
        return 1;
    }

    // non-text payload, NUL and bytes that are not valid UTF-8
    const std::array<std::byte, 6> binary{std::byte{0x00}, std::byte{0xff}, std::byte{0x80},
                                          std::byte{0x0a}, std::byte{0x00}, std::byte{0xc3}};
    const auto raw = sha256(binary);
    if (raw.size() != 32) {
        std::cerr << "sha256 returned " << raw.size() << " bytes\n";
        return 1;
    }
    if (to_hex(raw) != sha256_hex(binary)) {
        std::cerr << "sha256 and sha256_hex disagree\n";
        return 1;
    }
    if (sha256_hex(binary) != sha256_hex(std::string_view{"\0\xff\x80\n\0\xc3", 6})) {
        std::cerr << "sha256_hex differs between byte and char input\n";
        return 1;
    }
    auto flipped = binary;
    flipped[5] = std::byte{0xc2};
    if (sha256_hex(flipped) == sha256_hex(binary)) {
        std::cerr << "sha256_hex ignored a changed byte\n";
        return 1;
    }

    // RFC 4231 test case 1, binary key
    const std::vector<std::uint8_t> key1(20, 0x0b);
    if (const auto mac = hmac_sha256_hex(key1, "Hi There");
        mac != "b0344c61d8db38535ca8afceaf0bf12b881dc200c9833da726e9376c2e32cff7") {
        std::cerr << "hmac_sha256_hex test case 1 failed, got " << mac << "\n";
        return 1;
    }

    // RFC 4231 test case 2
    const std::vector<std::uint8_t> key2{'J', 'e', 'f', 'e'};
    const auto mac2 = hmac_sha256(key2, "what do ya want for nothing?");
    if (to_hex(mac2) != "5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843") {
        std::cerr << "hmac_sha256 test case 2 failed, got " << to_hex(mac2) << "\n";
        return 1;
    }
    if (hmac_sha256_hex(key2, "what do ya want for nothing?") != to_hex(mac2)) {
        std::cerr << "hmac_sha256 and hmac_sha256_hex disagree\n";
        return 1;
    }
}
