#include "s3sign/aws/error.hpp"
#include "s3sign/aws/iam/canonicalize.hpp"
#include "s3sign/aws/iam/request.hpp"
#include "s3sign/aws/iam/urlencode.hpp"

#include <boost/beast/http/verb.hpp>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace {

using s3sign::aws::iam::RequestDescriptor;

constexpr std::string_view empty_hash = "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";

[[nodiscard]] std::optional<std::string> uri_of(std::string path, bool is_path_encoded = false) {
    const RequestDescriptor request{.path = std::move(path), .is_path_encoded = is_path_encoded};
    auto uri = s3sign::aws::iam::canonical_uri(request);
    if (!uri) {
        return std::nullopt;
    }
    return std::move(uri).value();
}

[[nodiscard]] bool is_invalid_descriptor(const s3sign::aws::Result<s3sign::aws::iam::CanonicalRequest> &result) {
    return !result && result.error().code == s3sign::aws::errc::invalid_request_descriptor &&
           result.error().stage == s3sign::aws::Stage::canonical_request;
}

} // namespace

// NOLINTNEXTLINE(bugprone-exception-escape)
int main() {
    using namespace s3sign::aws::iam;

    {
        RequestDescriptor request{.method = boost::beast::http::verb::put,
                                  .path = "/path/to/file.jpg",
                                  .query = {{"qux", "baz"}, {"foo", "bar"}}};
        request.headers.set("x-amz-content-sha256", "abcdef0123456789");
        request.headers.set("X-amz-date", "20230330");
        request.headers.set("x-amz-expires", "3600");
        request.headers.set("Host", "bucket.s3.us-east-1.amazonaws.com");

        const auto canonical = canonicalize_request(request, "abcdef0123456789");

        constexpr auto canonical_chk =
            R"---(PUT
/path/to/file.jpg
foo=bar&qux=baz
host:bucket.s3.us-east-1.amazonaws.com
x-amz-content-sha256:abcdef0123456789
x-amz-date:20230330
x-amz-expires:3600

host;x-amz-content-sha256;x-amz-date;x-amz-expires
abcdef0123456789)---";

        if (!canonical || canonical->request != canonical_chk) {
            std::cerr << "canonicalize_request failed, got \n" << (canonical ? canonical->request : "error") << "\n";
            return 1;
        }
    }

    {
        const RequestDescriptor request{
            .query = {{"b", "2"}, {"a", "2"}, {"a", "1"}, {"x y", "a/b~c"}, {"acl", ""}, {"~", "*"}}};
        if (const auto query = canonical_query(request); query != "a=1&a=2&acl=&b=2&x%20y=a%2Fb~c&~=%2A") {
            std::cerr << "canonical_query failed, got " << query << "\n";
            return 1;
        }
        if (!canonical_query(RequestDescriptor{}).empty()) {
            std::cerr << "canonical_query of no parameters is not empty\n";
            return 1;
        }
    }

    {
        constexpr std::pair<std::string_view, std::string_view> plain[] = {
            {"", "/"},
            {"/", "/"},
            {"/a//b/", "/a//b/"},
            {"/test$file.text", "/test%24file.text"},
            {"/reports/2021-01.csv", "/reports/2021-01.csv"},
            {"/a b+c", "/a%20b%2Bc"},
            {"/~user/\xc3\xbc", "/~user/%C3%BC"},
        };
        for (const auto &[path, expected] : plain) {
            if (const auto uri = uri_of(std::string{path}); uri != expected) {
                std::cerr << "canonical_uri(" << path << ") failed, got " << uri.value_or("error") << "\n";
                return 1;
            }
        }
        if (uri_of("relative/path")) {
            std::cerr << "canonical_uri accepted a relative path\n";
            return 1;
        }

        constexpr std::pair<std::string_view, std::string_view> encoded[] = {
            {"/test%24file.text", "/test%24file.text"},
            {"/test$file.text", "/test%24file.text"},
            {"/a%2fb", "/a%2Fb"},
            {"/%7Euser//x", "/~user//x"},
        };
        for (const auto &[path, expected] : encoded) {
            const auto uri = uri_of(std::string{path}, true);
            if (uri != expected) {
                std::cerr << "canonical_uri(" << path << ", encoded) failed, got " << uri.value_or("error") << "\n";
                return 1;
            }
            if (normalize_encoded_path(*uri) != uri) {
                std::cerr << "normalize_encoded_path is not idempotent for " << *uri << "\n";
                return 1;
            }
        }
        if (uri_of("/bad%zz", true) || uri_of("/bad%2", true) || uri_of("no-slash", true)) {
            std::cerr << "canonical_uri accepted a malformed encoded path\n";
            return 1;
        }
    }

    {
        if (const auto value = normalize_header_value("  a   b\t \tc  "); value != "a b c") {
            std::cerr << "normalize_header_value failed, got '" << value << "'\n";
            return 1;
        }
        if (!normalize_header_value(" \t ").empty()) {
            std::cerr << "normalize_header_value of whitespace is not empty\n";
            return 1;
        }
    }

    {
        // input order and name case do not matter, only the canonical form does
        RequestDescriptor first{.host = "example.com", .path = "/object"};
        first.headers.set("X-Amz-Meta-Note", "  hello   world ");
        first.headers.set("x-amz-date", "20150830T123600Z");

        RequestDescriptor second{.path = "/object"};
        second.headers.set("x-amz-date", "20150830T123600Z");
        second.headers.set("host", "example.com");
        second.headers.set("x-amz-meta-note", "hello world");

        const auto first_canonical = canonicalize_request(first, empty_hash);
        const auto second_canonical = canonicalize_request(second, empty_hash);
        if (!first_canonical || !second_canonical || first_canonical->request != second_canonical->request) {
            std::cerr << "canonicalize_request depends on header order or case\n";
            return 1;
        }
        if (first_canonical->signed_headers != "host;x-amz-date;x-amz-meta-note") {
            std::cerr << "signed headers failed, got " << first_canonical->signed_headers << "\n";
            return 1;
        }

        // canonicalizing the canonical header block again changes nothing
        RequestDescriptor again{.path = first_canonical->uri};
        for (const auto &[name, value] : first_canonical->headers) {
            again.headers.insert(name, value);
        }
        const auto again_canonical = canonicalize_request(again, empty_hash);
        if (!again_canonical || again_canonical->request != first_canonical->request) {
            std::cerr << "canonicalize_request is not idempotent\n";
            return 1;
        }
    }

    {
        RequestDescriptor request{.host = "example.com", .path = "/"};
        request.headers.insert("X-Amz-Meta-A", "same");
        request.headers.insert("x-amz-meta-a", " same ");
        const auto canonical = canonicalize_request(request, empty_hash);
        if (!canonical || canonical->headers.size() != 2 || canonical->signed_headers != "host;x-amz-meta-a") {
            std::cerr << "identical headers differing in case did not collapse\n";
            return 1;
        }

        request.headers.insert("X-AMZ-META-A", "different");
        if (!is_invalid_descriptor(canonicalize_request(request, empty_hash))) {
            std::cerr << "ambiguous headers were accepted\n";
            return 1;
        }
    }

    {
        RequestDescriptor no_host{.path = "/"};
        if (!is_invalid_descriptor(canonicalize_request(no_host, empty_hash))) {
            std::cerr << "request without host was accepted\n";
            return 1;
        }

        RequestDescriptor conflicting_host{.host = "a.example.com", .path = "/"};
        conflicting_host.headers.set("Host", "b.example.com");
        if (!is_invalid_descriptor(canonicalize_request(conflicting_host, empty_hash))) {
            std::cerr << "conflicting host was accepted\n";
            return 1;
        }

        const RequestDescriptor relative{.host = "example.com", .path = "object"};
        if (!is_invalid_descriptor(canonicalize_request(relative, empty_hash))) {
            std::cerr << "relative path was accepted\n";
            return 1;
        }

        const RequestDescriptor unknown_method{
            .method = boost::beast::http::verb::unknown, .host = "example.com", .path = "/"};
        if (!is_invalid_descriptor(canonicalize_request(unknown_method, empty_hash))) {
            std::cerr << "unknown method was accepted\n";
            return 1;
        }

        RequestDescriptor presigned{.host = "example.com", .path = "/"};
        presigned.headers.set("Authorization", "AWS4-HMAC-SHA256 Credential=stale");
        if (!is_invalid_descriptor(canonicalize_request(presigned, empty_hash))) {
            std::cerr << "authorization header was signed\n";
            return 1;
        }
    }
}
