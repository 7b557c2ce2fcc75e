#pragma once

#include "s3sign/aws/error.hpp"

#include <chrono>
#include <format>
#include <string>
#include <string_view>

//
#include "s3sign/internal/macro-begin.hpp"

namespace s3sign::aws {

struct Scope {
    // YYYYMMDD, the UTC date of the request timestamp
    std::string date;
    std::string region;
    std::string service;
    constexpr static std::string_view footer = "aws4_request";
};

// derives the scope from the same timestamp that ends up in x-amz-date
[[nodiscard]] Result<Scope> make_scope(std::chrono::sys_seconds timestamp, std::string_view region,
                                       std::string_view service);

} // namespace s3sign::aws

template <> struct std::formatter<s3sign::aws::Scope> {
    [[nodiscard]] constexpr static auto parse(std::format_parse_context &ctx) { return ctx.begin(); }

    static auto format(const s3sign::aws::Scope &scope, std::format_context &ctx) {
        return std::format_to(ctx.out(), "{}/{}/{}/{}", scope.date, scope.region, scope.service,
                              s3sign::aws::Scope::footer);
    }
};

//
#include "s3sign/internal/macro-end.hpp"
