#pragma once

#include <boost/beast/http/fields.hpp> // IWYU pragma: keep
#include <boost/beast/http/verb.hpp>
#include <string>
#include <utility>
#include <vector>

//
#include "s3sign/internal/macro-begin.hpp"

namespace s3sign::aws::iam {

struct RequestDescriptor {
    boost::beast::http::verb method = boost::beast::http::verb::get;
    // used when headers carries no Host
    std::string host;
    // absolute path, percent-encoded only if is_path_encoded is set
    std::string path;
    bool is_path_encoded = false;
    // unencoded key/value pairs, order does not matter
    std::vector<std::pair<std::string, std::string>> query;
    // every header in here gets signed
    boost::beast::http::fields headers;
};

struct CanonicalRequest {
    std::string request;
    std::string uri;
    std::string query;
    std::string signed_headers;
    // lowercase name, normalized value, sorted by name
    std::vector<std::pair<std::string, std::string>> headers;
};

} // namespace s3sign::aws::iam

//
#include "s3sign/internal/macro-end.hpp"
