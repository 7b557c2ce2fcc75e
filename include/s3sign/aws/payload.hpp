#pragma once

#include "s3sign/aws/error.hpp"

#include <cstddef>
#include <filesystem>
#include <functional>
#include <span>
#include <vector>

//
#include "s3sign/internal/macro-begin.hpp"

namespace s3sign::aws {

// produces the exact bytes that will be sent as the request body
using PayloadSource = std::function<Result<std::vector<std::byte>>()>;

// the content length is whatever was read, no separate size lookup
[[nodiscard]] PayloadSource file_payload(std::filesystem::path path);
[[nodiscard]] PayloadSource memory_payload(std::span<const std::byte> data);

[[nodiscard]] Result<std::vector<std::byte>> read_file(const std::filesystem::path &path);

} // namespace s3sign::aws

//
#include "s3sign/internal/macro-end.hpp"
