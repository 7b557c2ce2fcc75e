#include "s3sign/aws/iam/urlencode.hpp"

#include <boost/url/encode.hpp> // IWYU pragma: keep
#include <boost/url/grammar/charset.hpp>
#include <boost/url/grammar/hexdig_chars.hpp>
#include <boost/url/grammar/lut_chars.hpp>
#include <boost/url/pct_string_view.hpp>
#include <format>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>

namespace s3sign::aws::iam {

namespace {

constexpr boost::urls::grammar::lut_chars charset = "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
                                                    "abcdefghijklmnopqrstuvwxyz"
                                                    "1234567890"
                                                    "-._~";

constexpr boost::urls::grammar::lut_chars path_charset = charset + "/";

void append_encoded(std::string &out, char chr) {
    if (charset(chr)) {
        out.push_back(chr);
    } else {
        std::format_to(std::back_inserter(out), "%{:02X}", static_cast<unsigned char>(chr));
    }
}

} // namespace

std::string urlencode(std::string_view input) { return boost::urls::encode(input, charset); }

std::string urlencode_path(std::string_view input) { return boost::urls::encode(input, path_charset); }

std::optional<std::string> normalize_encoded_path(std::string_view input) {
    if (input.empty()) {
        return "/";
    }
    if (input.front() != '/' || !boost::urls::make_pct_string_view(input)) {
        return std::nullopt;
    }

    std::string ret;
    ret.reserve(input.size());
    for (std::size_t i = 0; i < input.size(); i++) {
        const char chr = input[i];
        if (chr == '%') {
            // make_pct_string_view guarantees two hex digits follow
            const auto high = boost::urls::grammar::hexdig_value(input[i + 1]);
            const auto low = boost::urls::grammar::hexdig_value(input[i + 2]);
            append_encoded(ret, static_cast<char>((high << 4) | low));
            i += 2;
        } else if (chr == '/') {
            ret.push_back(chr);
        } else {
            append_encoded(ret, chr);
        }
    }
    return ret;
}

} // namespace s3sign::aws::iam
