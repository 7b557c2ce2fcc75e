#include "s3sign/aws/iam/batch.hpp"

#include "s3sign/aws/error.hpp"
#include "s3sign/aws/iam/signer.hpp"

#include <algorithm>
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <chrono>
#include <cstddef>
#include <exception>
#include <optional>
#include <utility>
#include <vector>

namespace s3sign::aws::iam {

namespace {

[[nodiscard]] Result<SignedJob> sign_one(const Signer &signer, SignJob job,
                                         std::optional<std::chrono::sys_seconds> timestamp) {
    if (!job.payload) {
        return fail(errc::payload_read_error, Stage::payload, "no payload source");
    }
    auto payload = job.payload();
    if (!payload) {
        return std::unexpected{std::move(payload).error()};
    }

    auto signed_request = timestamp ? signer.sign(std::move(job.request), *payload, *timestamp)
                                    : signer.sign(std::move(job.request), *payload);
    if (!signed_request) {
        return std::unexpected{std::move(signed_request).error()};
    }
    return SignedJob{.request = std::move(signed_request).value(), .payload = std::move(payload).value()};
}

} // namespace

std::vector<Result<SignedJob>> sign_batch(const Signer &signer, std::vector<SignJob> jobs, std::size_t max_workers,
                                          std::optional<std::chrono::sys_seconds> timestamp) {
    std::vector<Result<SignedJob>> ret(jobs.size());
    if (jobs.empty()) {
        return ret;
    }

    // an exception must not leave a worker thread, it is rethrown once all tasks are done
    std::vector<std::exception_ptr> exceptions(jobs.size());

    boost::asio::thread_pool pool{std::clamp<std::size_t>(max_workers, 1, jobs.size())};
    for (std::size_t i = 0; i < jobs.size(); i++) {
        // each task owns its job and writes only its own slot
        boost::asio::post(pool, [&signer, &ret, &exceptions, i, job = std::move(jobs[i]), timestamp]() mutable {
            try {
                ret[i] = sign_one(signer, std::move(job), timestamp);
            } catch (...) {
                exceptions[i] = std::current_exception();
            }
        });
    }
    pool.join();

    for (auto &exception : exceptions) {
        if (exception) {
            std::rethrow_exception(std::move(exception));
        }
    }

    return ret;
}

} // namespace s3sign::aws::iam
