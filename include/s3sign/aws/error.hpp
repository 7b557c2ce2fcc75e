#pragma once

#include <boost/describe/enum.hpp>
#include <boost/system/error_category.hpp>
#include <boost/system/error_code.hpp> // IWYU pragma: keep
#include <cstdint>
#include <expected>
#include <format>
#include <string>
#include <type_traits>
#include <utility>

//
#include "s3sign/internal/macro-begin.hpp"

namespace s3sign::aws {

enum class errc : std::uint8_t {
    missing_credential = 1,
    invalid_request_descriptor,
    payload_read_error,
    unsupported_region_or_service,
    clock_source_error
};
BOOST_DESCRIBE_ENUM(errc, missing_credential, invalid_request_descriptor, payload_read_error,
                    unsupported_region_or_service, clock_source_error);

// pipeline stage an error originated from
enum class Stage : std::uint8_t {
    credentials,
    clock,
    scope,
    payload,
    canonical_request,
    string_to_sign,
    signing_key,
    signature
};
BOOST_DESCRIBE_ENUM(Stage, credentials, clock, scope, payload, canonical_request, string_to_sign, signing_key,
                    signature);

[[nodiscard]] const boost::system::error_category &sign_category() noexcept;

[[nodiscard]] inline boost::system::error_code make_error_code(errc err) noexcept {
    return {static_cast<int>(err), sign_category()};
}

struct Error {
    boost::system::error_code code;
    Stage stage{};
    // must never carry secret material
    std::string detail;
};

template <typename T> using Result = std::expected<T, Error>;

[[nodiscard]] inline std::unexpected<Error> fail(errc err, Stage stage, std::string detail = {}) {
    return std::unexpected<Error>{Error{.code = make_error_code(err), .stage = stage, .detail = std::move(detail)}};
}

[[nodiscard]] const char *to_string(Stage stage) noexcept;

} // namespace s3sign::aws

template <> struct boost::system::is_error_code_enum<s3sign::aws::errc> : public std::true_type {};

template <> struct std::formatter<s3sign::aws::Error> {
    [[nodiscard]] constexpr static auto parse(std::format_parse_context &ctx) { return ctx.begin(); }

    static auto format(const s3sign::aws::Error &error, std::format_context &ctx) {
        if (error.detail.empty()) {
            return std::format_to(ctx.out(), "{}: {}", s3sign::aws::to_string(error.stage), error.code.message());
        }
        return std::format_to(ctx.out(), "{}: {} ({})", s3sign::aws::to_string(error.stage), error.code.message(),
                              error.detail);
    }
};

//
#include "s3sign/internal/macro-end.hpp"
