#include "s3sign/aws/scope.hpp"

#include "s3sign/aws/error.hpp"

#include <algorithm>
#include <chrono>
#include <format>
#include <string>
#include <string_view>

namespace s3sign::aws {

namespace {

// region and service end up verbatim between the '/' separators of the credential scope
[[nodiscard]] bool valid_scope_component(std::string_view component) {
    return !component.empty() && std::ranges::none_of(component, [](char chr) {
        return chr == '/' || chr == ' ' || chr == '\t' || chr == '\r' || chr == '\n';
    });
}

} // namespace

Result<Scope> make_scope(std::chrono::sys_seconds timestamp, std::string_view region, std::string_view service) {
    if (!valid_scope_component(region)) {
        return fail(errc::unsupported_region_or_service, Stage::scope, std::format("region '{}'", region));
    }
    if (!valid_scope_component(service)) {
        return fail(errc::unsupported_region_or_service, Stage::scope, std::format("service '{}'", service));
    }
    return Scope{.date = std::format("{:%Y%m%d}", timestamp), .region = std::string{region},
                 .service = std::string{service}};
}

} // namespace s3sign::aws
