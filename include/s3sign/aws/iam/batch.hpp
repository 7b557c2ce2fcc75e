#pragma once

#include "s3sign/aws/error.hpp"
#include "s3sign/aws/iam/request.hpp"
#include "s3sign/aws/iam/signer.hpp"
#include "s3sign/aws/payload.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <vector>

//
#include "s3sign/internal/macro-begin.hpp"

namespace s3sign::aws::iam {

struct SignJob {
    RequestDescriptor request;
    PayloadSource payload;
};

struct SignedJob {
    SignedRequest request;
    // the body the signature covers
    std::vector<std::byte> payload;
};

// Signs every job on at most max_workers threads. Results are in job order, a
// failing job leaves the others untouched. Without a timestamp every job asks
// the signer's clock. An exception thrown by a job, e.g. from its payload
// source, is rethrown after every job has finished.
[[nodiscard]] std::vector<Result<SignedJob>> sign_batch(const Signer &signer, std::vector<SignJob> jobs,
                                                        std::size_t max_workers,
                                                        std::optional<std::chrono::sys_seconds> timestamp = {});

} // namespace s3sign::aws::iam

//
#include "s3sign/internal/macro-end.hpp"
