#include "s3sign/aws/iam/signing_key_cache.hpp"

#include "s3sign/aws/credentials.hpp"
#include "s3sign/aws/iam/digest.hpp"
#include "s3sign/aws/iam/sign_request.hpp"
#include "s3sign/aws/scope.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <utility>
#include <vector>

namespace s3sign::aws::iam {

SigningKeyCache::Key SigningKeyCache::get(const Credentials &credentials, const Scope &scope) {
    Entry entry{.access_key = credentials.access_key,
                .secret_fingerprint = sha256_hex(credentials.secret_access_key),
                .date = scope.date,
                .region = scope.region,
                .service = scope.service};

    {
        const std::shared_lock shared_lock{keys_mutex};
        if (const auto iter = keys.find(entry); iter != keys.end()) {
            return iter->second;
        }
    }

    // derive outside the lock, concurrent misses compute the same key
    auto key = std::make_shared<const std::vector<std::uint8_t>>(
        get_signing_key(credentials.secret_access_key, scope));

    const std::unique_lock lock{keys_mutex};
    std::erase_if(keys, [&scope](const auto &item) { return item.first.date < scope.date; });
    return keys.try_emplace(std::move(entry), std::move(key)).first->second;
}

std::size_t SigningKeyCache::size() const {
    const std::shared_lock shared_lock{keys_mutex};
    return keys.size();
}

void SigningKeyCache::clear() {
    const std::unique_lock lock{keys_mutex};
    keys.clear();
}

} // namespace s3sign::aws::iam
