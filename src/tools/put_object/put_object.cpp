#include "s3sign/aws/credentials.hpp"
#include "s3sign/aws/error.hpp"
#include "s3sign/aws/iam/batch.hpp"
#include "s3sign/aws/iam/signer.hpp"
#include "s3sign/aws/iam/signing_key_cache.hpp"
#include "s3sign/aws/iam/string_to_sign.hpp"
#include "s3sign/aws/payload.hpp"
#include "s3sign/aws/s3/put_object.hpp"
#include "transport.hpp"

#include <boost/algorithm/string/trim.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp> // IWYU pragma: keep
#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/beast/http/status.hpp>
#include <boost/beast/http/verb.hpp>
#include <boost/describe/enum_from_string.hpp>
#include <boost/program_options/options_description.hpp>
#include <boost/program_options/parsers.hpp>
#include <boost/program_options/positional_options.hpp>
#include <boost/program_options/value_semantic.hpp>
#include <boost/program_options/variables_map.hpp>
#include <boost/url/parse.hpp>
#include <boost/url/url.hpp>
#include <chrono>
#include <cstddef>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <ostream>
#include <print>
#include <sstream>
#include <string>
#include <thread>
#include <utility>
#include <vector>

using namespace s3sign;

namespace {

[[nodiscard]] std::string file_to_string(const std::filesystem::path &path) {
    const std::ifstream stream{path};
    std::stringstream buffer;
    buffer << stream.rdbuf();
    return buffer.str();
}

[[nodiscard]] std::string from_file_or_env(const std::string &path, const char *env) {
    std::string ret;
    if (!path.empty()) {
        ret = file_to_string(path);
    } else if (const char *value = std::getenv(env); value != nullptr) {
        ret = value;
    }
    boost::algorithm::trim(ret);
    return ret;
}

struct Options {
    boost::urls::url endpoint;
    std::string bucket;
    std::string region;
    std::string key;
    std::string prefix;
    std::optional<aws::s3::StorageClass_t> storage_class;
    std::optional<std::string> content_type;
    aws::s3::AddressingStyle_t style = aws::s3::AddressingStyle_t::virtual_host;
    aws::Credentials credentials;
    std::optional<std::chrono::sys_seconds> timestamp;
    std::size_t jobs{};
    bool dry_run = false;
    std::vector<std::string> files;
};

[[nodiscard]] Options parse_opts(int argc, char **argv) {

    Options ret;
    std::string endpoint;
    std::string access_key_file;
    std::string secret_key_file;
    std::string storage_class;
    std::string content_type;
    std::string timestamp;

    boost::program_options::options_description descr{"Options"};
    // clang-format off
    descr.add_options()
        ("help,h", "print this help")
        ("endpoint,e", boost::program_options::value<std::string>(&endpoint)->required(), "endpoint URL, including protocol and (if required) port")
        ("bucket,b", boost::program_options::value<std::string>(&ret.bucket)->required(), "S3 bucket name")
        ("region,r", boost::program_options::value<std::string>(&ret.region)->default_value("us-east-1"), "signing region")
        ("key,k", boost::program_options::value<std::string>(&ret.key), "object key, only with a single file")
        ("prefix,p", boost::program_options::value<std::string>(&ret.prefix), "key prefix, the file name is appended")
        ("storage-class", boost::program_options::value<std::string>(&storage_class), "x-amz-storage-class, e.g. STANDARD or REDUCED_REDUNDANCY")
        ("content-type", boost::program_options::value<std::string>(&content_type), "Content-Type of the objects")
        ("path-style", boost::program_options::bool_switch(), "address the bucket in the path instead of the host")
        ("access-key-file", boost::program_options::value<std::string>(&access_key_file), "path to access key file, defaults to $AWS_ACCESS_KEY_ID")
        ("secret-access-key-file", boost::program_options::value<std::string>(&secret_key_file), "path to secret key file, defaults to $AWS_SECRET_ACCESS_KEY")
        ("timestamp", boost::program_options::value<std::string>(&timestamp), "sign with this YYYYMMDDTHHMMSSZ timestamp instead of the current time")
        ("jobs,j", boost::program_options::value<std::size_t>(&ret.jobs)->default_value(std::thread::hardware_concurrency()), "number of signing threads")
        ("dry-run,n", boost::program_options::bool_switch(&ret.dry_run), "print the signed requests instead of sending them")
        ("file", boost::program_options::value<std::vector<std::string>>(&ret.files)->required(), "files to upload")
    ;
    // clang-format on
    boost::program_options::positional_options_description positional;
    positional.add("file", -1);

    boost::program_options::variables_map varmap;
    boost::program_options::store(
        boost::program_options::command_line_parser(argc, argv).options(descr).positional(positional).run(), varmap);
    if (varmap.contains("help")) {
        std::println("sign and upload files to a S3 bucket\n"
                     "usage: s3sign-put [options] file...\n");
        std::cout << descr << '\n';
        exit(0);
    }
    boost::program_options::notify(varmap);

    const auto parsed_endpoint = boost::urls::parse_uri(endpoint);
    if (!parsed_endpoint) {
        std::println(std::cerr, "Invalid endpoint '{}': {}", endpoint, parsed_endpoint.error().message());
        exit(1);
    }
    ret.endpoint = *parsed_endpoint;

    if (!ret.key.empty() && ret.files.size() != 1) {
        std::println(std::cerr, "--key requires exactly one file, use --prefix for several.");
        exit(1);
    }

    if (!storage_class.empty()) {
        aws::s3::StorageClass_t parsed{};
        if (!boost::describe::enum_from_string(storage_class.c_str(), parsed)) {
            std::println(std::cerr, "Invalid storage class '{}'.", storage_class);
            exit(1);
        }
        ret.storage_class = parsed;
    }
    if (!content_type.empty()) {
        ret.content_type = content_type;
    }
    if (varmap["path-style"].as<bool>()) {
        ret.style = aws::s3::AddressingStyle_t::path;
    }

    if (!timestamp.empty()) {
        ret.timestamp = aws::iam::parse_timestamp(timestamp);
        if (!ret.timestamp) {
            std::println(std::cerr, "Invalid timestamp '{}', expected YYYYMMDDTHHMMSSZ.", timestamp);
            exit(1);
        }
    }

    ret.credentials.access_key = from_file_or_env(access_key_file, "AWS_ACCESS_KEY_ID");
    ret.credentials.secret_access_key = from_file_or_env(secret_key_file, "AWS_SECRET_ACCESS_KEY");

    return ret;
}

[[nodiscard]] std::string object_key(const Options &options, const std::string &file) {
    if (!options.key.empty()) {
        return options.key;
    }
    return options.prefix + std::filesystem::path{file}.filename().string();
}

void print_request(const std::string &file, const aws::iam::SignedRequest &request) {
    std::println("# {}", file);
    std::println("PUT {}{}{}", request.canonical.uri, request.canonical.query.empty() ? "" : "?",
                 request.canonical.query);
    for (const auto &field : request.headers) {
        std::println("{}: {}", std::string_view{field.name_string()}, std::string_view{field.value()});
    }
    std::println("");
}

boost::asio::awaitable<bool> upload_all(const Options &options, const std::vector<std::string> &files,
                                        const std::vector<aws::Result<aws::iam::SignedJob>> &results,
                                        boost::asio::ssl::context &ssl_ctx) {
    bool ok = true;
    for (std::size_t i = 0; i < results.size(); i++) {
        if (!results[i]) {
            continue;
        }
        const auto &job = *results[i];
        const auto response = co_await tools::put_object::send(options.endpoint, boost::beast::http::verb::put,
                                                               job.request, job.payload, ssl_ctx);
        if (!response) {
            std::println(std::cerr, "ERROR uploading {}: {}", files[i], response.error().message());
            ok = false;
            continue;
        }
        if (boost::beast::http::to_status_class(response->result()) != boost::beast::http::status_class::successful) {
            std::println(std::cerr, "ERROR uploading {}: HTTP {}\n{}", files[i], response->result_int(),
                         response->body());
            ok = false;
            continue;
        }
        std::println(std::cerr, "uploaded {} ({} bytes)", files[i], job.payload.size());
    }
    co_return ok;
}

} // namespace

// NOLINTNEXTLINE(bugprone-exception-escape)
int main(int argc, char **argv) {
    const Options options = parse_opts(argc, argv);

    const aws::iam::Signer signer{options.credentials, options.region, std::string{aws::s3::service},
                                  aws::iam::SignerOptions{.sign_content_sha256 = true, .sign_content_length = true},
                                  std::make_shared<aws::iam::SigningKeyCache>()};

    std::vector<aws::iam::SignJob> jobs;
    jobs.reserve(options.files.size());
    for (const auto &file : options.files) {
        const aws::s3::PutObjectParameters parameters{.Bucket = options.bucket,
                                                      .Key = object_key(options, file),
                                                      .StorageClass = options.storage_class,
                                                      .ContentType = options.content_type};
        auto request = aws::s3::put_object_request(options.endpoint, parameters, std::nullopt, options.style);
        if (!request) {
            std::println(std::cerr, "ERROR preparing {}: {}", file, request.error());
            return 1;
        }
        jobs.push_back({.request = std::move(request).value(), .payload = aws::file_payload(file)});
    }

    const auto results = aws::iam::sign_batch(signer, std::move(jobs), options.jobs, options.timestamp);

    bool ok = true;
    for (std::size_t i = 0; i < results.size(); i++) {
        if (!results[i]) {
            std::println(std::cerr, "ERROR signing {}: {}", options.files[i], results[i].error());
            ok = false;
        } else if (options.dry_run) {
            print_request(options.files[i], results[i]->request);
        }
    }

    if (!options.dry_run) {
        boost::asio::ssl::context ssl_ctx{boost::asio::ssl::context::tls_client};
        ssl_ctx.set_default_verify_paths();
        ssl_ctx.set_verify_mode(boost::asio::ssl::verify_peer);

        boost::asio::io_context context;
        boost::asio::co_spawn(context, upload_all(options, options.files, results, ssl_ctx),
                              [&ok](std::exception_ptr exception, bool uploaded) {
                                  if (exception) {
                                      std::rethrow_exception(std::move(exception));
                                  }
                                  ok = ok && uploaded;
                              });
        context.run();
    }

    return ok ? 0 : 1;
}
