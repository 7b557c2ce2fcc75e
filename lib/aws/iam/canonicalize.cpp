#include "s3sign/aws/iam/canonicalize.hpp"

#include "s3sign/aws/error.hpp"
#include "s3sign/aws/iam/request.hpp"
#include "s3sign/aws/iam/urlencode.hpp"

#include <algorithm>
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/beast/http/fields.hpp> // IWYU pragma: keep
#include <boost/beast/http/verb.hpp>
#include <boost/url/grammar/charset.hpp>
#include <boost/url/grammar/lut_chars.hpp>
#include <format>
#include <functional>
#include <iterator>
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace s3sign::aws::iam {

namespace {

// RFC 9110 tchar
constexpr boost::urls::grammar::lut_chars token_charset = "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
                                                          "abcdefghijklmnopqrstuvwxyz"
                                                          "1234567890"
                                                          "!#$%&'*+-.^_`|~";

[[nodiscard]] bool is_whitespace(char chr) { return chr == ' ' || chr == '\t'; }

[[nodiscard]] bool is_token(std::string_view name) {
    return !name.empty() &&
           boost::urls::grammar::find_if_not(name.begin(), name.end(), token_charset) == name.end();
}

} // namespace

std::string normalize_header_value(std::string_view value) {
    std::string ret;
    ret.reserve(value.size());
    bool pending_space = false;
    for (const char chr : value) {
        if (is_whitespace(chr)) {
            pending_space = true;
            continue;
        }
        if (pending_space && !ret.empty()) {
            ret.push_back(' ');
        }
        pending_space = false;
        ret.push_back(chr);
    }
    return ret;
}

Result<std::string> canonical_uri(const RequestDescriptor &request) {
    if (request.path.empty()) {
        return "/";
    }
    if (request.is_path_encoded) {
        auto normalized = normalize_encoded_path(request.path);
        if (!normalized) {
            return fail(errc::invalid_request_descriptor, Stage::canonical_request,
                        std::format("malformed path '{}'", request.path));
        }
        return std::move(normalized).value();
    }
    if (request.path.front() != '/') {
        return fail(errc::invalid_request_descriptor, Stage::canonical_request,
                    std::format("path '{}' is not absolute", request.path));
    }
    return urlencode_path(request.path);
}

std::string canonical_query(const RequestDescriptor &request) {
    std::vector<std::pair<std::string, std::string>> params;
    params.reserve(request.query.size());
    std::ranges::transform(request.query, std::back_inserter(params), [](const auto &param) {
        return std::pair{urlencode(param.first), urlencode(param.second)};
    });
    // sorted by encoded key, then encoded value
    std::ranges::sort(params);

    std::string ret;
    for (const auto &[key, value] : params) {
        std::format_to(std::back_inserter(ret), "{}={}&", key, value);
    }
    if (!ret.empty()) {
        ret.pop_back();
    }
    return ret;
}

Result<CanonicalRequest> canonicalize_request(const RequestDescriptor &request, std::string_view payload_hash) {
    // see https://docs.aws.amazon.com/AmazonS3/latest/API/sig-v4-header-based-auth.html
    // for the canonicalization scheme

    if (request.method == boost::beast::http::verb::unknown) {
        return fail(errc::invalid_request_descriptor, Stage::canonical_request, "unknown method");
    }

    CanonicalRequest ret;

    auto uri = canonical_uri(request);
    if (!uri) {
        return std::unexpected{std::move(uri).error()};
    }
    ret.uri = std::move(uri).value();
    ret.query = canonical_query(request);

    // CanonicalHeaders
    // use a map to get them in order
    std::map<std::string, std::string, std::less<>> headers;
    for (const auto &field : request.headers) {
        const std::string_view name_view = field.name_string();
        if (!is_token(name_view)) {
            return fail(errc::invalid_request_descriptor, Stage::canonical_request,
                        std::format("invalid header name '{}'", name_view));
        }
        std::string name{name_view};
        boost::algorithm::to_lower(name);
        // the signature itself goes there
        if (name == "authorization") {
            return fail(errc::invalid_request_descriptor, Stage::canonical_request,
                        "authorization header cannot be signed");
        }
        const std::string value = normalize_header_value(field.value());

        // names differing only in case collapse into one entry
        const auto [iter, inserted] = headers.try_emplace(std::move(name), value);
        if (!inserted && iter->second != value) {
            return fail(errc::invalid_request_descriptor, Stage::canonical_request,
                        std::format("ambiguous header '{}'", iter->first));
        }
    }

    if (const auto host = headers.find("host"); host == headers.end()) {
        if (request.host.empty()) {
            return fail(errc::invalid_request_descriptor, Stage::canonical_request, "no host");
        }
        headers.emplace("host", normalize_header_value(request.host));
    } else if (!request.host.empty() && host->second != normalize_header_value(request.host)) {
        return fail(errc::invalid_request_descriptor, Stage::canonical_request,
                    std::format("host header '{}' disagrees with host '{}'", host->second, request.host));
    }

    for (const auto &[name, value] : headers) {
        ret.signed_headers.append(std::format("{};", name));
    }
    ret.signed_headers.pop_back();

    // HTTPMethod
    ret.request.append(boost::beast::http::to_string(request.method));
    ret.request.append("\n");

    // CanonicalURI
    ret.request.append(ret.uri);
    ret.request.append("\n");

    // CanonicalQueryString
    ret.request.append(ret.query);
    ret.request.append("\n");

    for (const auto &[name, value] : headers) {
        ret.request.append(std::format("{}:{}\n", name, value));
    }
    ret.request.append("\n");

    // SignedHeaders
    ret.request.append(ret.signed_headers);
    ret.request.append("\n");

    // HashedPayload
    ret.request.append(payload_hash);

    ret.headers.assign(std::make_move_iterator(headers.begin()), std::make_move_iterator(headers.end()));

    return ret;
}

} // namespace s3sign::aws::iam
