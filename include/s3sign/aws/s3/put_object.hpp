#pragma once

#include "s3sign/aws/error.hpp"
#include "s3sign/aws/iam/request.hpp"
#include "s3sign/aws/iam/signer.hpp"

#include <boost/describe/class.hpp>
#include <boost/describe/enum.hpp>
#include <boost/url/url_view.hpp>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

//
#include "s3sign/internal/macro-begin.hpp"

namespace s3sign::aws::s3 {

constexpr std::string_view service = "s3";

enum class StorageClass_t : std::uint8_t {
    STANDARD,
    REDUCED_REDUNDANCY,
    GLACIER,
    STANDARD_IA,
    ONEZONE_IA,
    INTELLIGENT_TIERING,
    DEEP_ARCHIVE,
    OUTPOSTS,
    GLACIER_IR,
    SNOW,
    EXPRESS_ONEZONE,
    FSX_OPENZFS
};
BOOST_DESCRIBE_ENUM(StorageClass_t, STANDARD, REDUCED_REDUNDANCY, GLACIER, STANDARD_IA, ONEZONE_IA,
                    INTELLIGENT_TIERING, DEEP_ARCHIVE, OUTPOSTS, GLACIER_IR, SNOW, EXPRESS_ONEZONE, FSX_OPENZFS);

enum class AddressingStyle_t : std::uint8_t {
    // bucket.endpoint/key
    virtual_host,
    // endpoint/bucket/key
    path
};

struct PutObjectParameters {
    std::string Bucket;
    // unencoded object key
    std::string Key;
    std::optional<StorageClass_t> StorageClass;
    std::optional<std::string> ContentType;
};
BOOST_DESCRIBE_STRUCT(PutObjectParameters, (), (Bucket, Key, StorageClass, ContentType));

// without a content length the signer has to be set up with sign_content_length
[[nodiscard]] Result<iam::RequestDescriptor>
put_object_request(boost::urls::url_view endpoint, const PutObjectParameters &parameters,
                   std::optional<std::uint64_t> content_length,
                   AddressingStyle_t style = AddressingStyle_t::virtual_host);

[[nodiscard]] Result<iam::SignedRequest>
sign_put_object(const iam::Signer &signer, boost::urls::url_view endpoint, const PutObjectParameters &parameters,
                std::span<const std::byte> payload, AddressingStyle_t style = AddressingStyle_t::virtual_host,
                std::optional<std::chrono::sys_seconds> timestamp = {});

} // namespace s3sign::aws::s3

//
#include "s3sign/internal/macro-end.hpp"
