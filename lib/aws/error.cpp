#include "s3sign/aws/error.hpp"

#include <boost/describe/enum_to_string.hpp>
#include <boost/system/error_category.hpp>
#include <string>

namespace s3sign::aws {

namespace {

class SignCategory final : public boost::system::error_category {
public:
    [[nodiscard]] const char *name() const noexcept override { return "s3sign"; }

    [[nodiscard]] std::string message(int value) const override {
        switch (static_cast<errc>(value)) {
        case errc::missing_credential:
            return "access key id or secret access key missing";
        case errc::invalid_request_descriptor:
            return "invalid request descriptor";
        case errc::payload_read_error:
            return "failed to read payload";
        case errc::unsupported_region_or_service:
            return "unsupported region or service";
        case errc::clock_source_error:
            return "request timestamp unavailable";
        }
        return "unknown s3sign error";
    }
};

} // namespace

const boost::system::error_category &sign_category() noexcept {
    static const SignCategory category;
    return category;
}

const char *to_string(Stage stage) noexcept { return boost::describe::enum_to_string(stage, "unknown"); }

} // namespace s3sign::aws
