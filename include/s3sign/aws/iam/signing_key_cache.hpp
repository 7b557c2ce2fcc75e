#pragma once

#include "s3sign/aws/credentials.hpp"
#include "s3sign/aws/scope.hpp"

#include <compare>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

//
#include "s3sign/internal/macro-begin.hpp"

namespace s3sign::aws::iam {

// Signing keys only depend on the secret and the scope, so they can be shared
// between requests of the same UTC day. Safe for concurrent use.
class SigningKeyCache {
public:
    using Key = std::shared_ptr<const std::vector<std::uint8_t>>;

private:
    struct Entry {
        std::string access_key;
        // SHA-256 of the secret, rotated secrets must not hit old keys
        std::string secret_fingerprint;
        std::string date;
        std::string region;
        std::string service;

        [[nodiscard]] std::strong_ordering operator<=>(const Entry &rhs) const = default;
    };

    mutable std::shared_mutex keys_mutex;
    std::map<Entry, Key> keys;

public:
    // derives and inserts on a miss; entries for days before scope.date are evicted
    [[nodiscard]] Key get(const Credentials &credentials, const Scope &scope);

    [[nodiscard]] std::size_t size() const;
    void clear();
};

} // namespace s3sign::aws::iam

//
#include "s3sign/internal/macro-end.hpp"
