#pragma once

#include <string>

//
#include "s3sign/internal/macro-begin.hpp"

namespace s3sign::aws {

// never logged, never formatted
class Credentials {
public:
    std::string access_key;
    std::string secret_access_key;
};

} // namespace s3sign::aws

//
#include "s3sign/internal/macro-end.hpp"
