#include "s3sign/aws/payload.hpp"

#include "s3sign/aws/error.hpp"

#include <array>
#include <cerrno>
#include <cstddef>
#include <filesystem>
#include <format>
#include <fstream>
#include <ios>
#include <span>
#include <system_error>
#include <utility>
#include <vector>

namespace s3sign::aws {

Result<std::vector<std::byte>> read_file(const std::filesystem::path &path) {
    std::ifstream stream{path, std::ios::binary};
    if (!stream) {
        return fail(errc::payload_read_error, Stage::payload,
                    std::format("{}: {}", path.string(), std::generic_category().message(errno)));
    }

    // read until EOF, sizes reported by the filesystem are not trusted
    std::vector<std::byte> ret;
    std::array<char, 64 * 1024> buf{};
    while (stream.read(buf.data(), buf.size()) || stream.gcount() > 0) {
        const auto chunk = std::as_bytes(std::span{buf.data(), static_cast<std::size_t>(stream.gcount())});
        ret.insert(ret.end(), chunk.begin(), chunk.end());
    }
    if (stream.bad()) {
        return fail(errc::payload_read_error, Stage::payload,
                    std::format("{}: read failed after {} bytes", path.string(), ret.size()));
    }
    return ret;
}

PayloadSource file_payload(std::filesystem::path path) {
    return [path = std::move(path)]() { return read_file(path); };
}

PayloadSource memory_payload(std::span<const std::byte> data) {
    return [bytes = std::vector<std::byte>(data.begin(), data.end())]() -> Result<std::vector<std::byte>> {
        return bytes;
    };
}

} // namespace s3sign::aws
