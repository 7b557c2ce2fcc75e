#pragma once

#include "s3sign/aws/error.hpp"
#include "s3sign/aws/iam/request.hpp"

#include <string>
#include <string_view>

//
#include "s3sign/internal/macro-begin.hpp"

namespace s3sign::aws::iam {

// trims and collapses internal whitespace runs to a single space
[[nodiscard]] std::string normalize_header_value(std::string_view value);

[[nodiscard]] Result<std::string> canonical_uri(const RequestDescriptor &request);
[[nodiscard]] std::string canonical_query(const RequestDescriptor &request);

// payload_hash is the lowercase hex SHA-256 of the body that will be sent
[[nodiscard]] Result<CanonicalRequest> canonicalize_request(const RequestDescriptor &request,
                                                            std::string_view payload_hash);

} // namespace s3sign::aws::iam

//
#include "s3sign/internal/macro-end.hpp"
