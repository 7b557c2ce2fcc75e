#pragma once

#include <optional>
#include <string>
#include <string_view>

//
#include "s3sign/internal/macro-begin.hpp"

namespace s3sign::aws::iam {

// everything but A-Za-z0-9-_.~ is percent-encoded with uppercase hex digits
[[nodiscard]] std::string urlencode(std::string_view input);
// like urlencode, but '/' is kept
[[nodiscard]] std::string urlencode_path(std::string_view input);

// Brings an already percent-encoded absolute path into canonical form.
// Returns nullopt on malformed escapes or a relative path.
[[nodiscard]] std::optional<std::string> normalize_encoded_path(std::string_view input);

} // namespace s3sign::aws::iam

//
#include "s3sign/internal/macro-end.hpp"
