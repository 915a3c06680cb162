/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "s3up/config.hh"
#include "s3up/errors.hh"

#include <cstdlib>
#include <exception>

#include <fmt/format.h>
#include <seastar/core/format.hh>

namespace bpo = boost::program_options;

namespace s3up {

upload_config upload_config::from_environment(const env_lookup& env) {
    upload_config cfg;
    if (auto v = env("S3_REGION")) {
        cfg.region = *v;
    }
    if (auto v = env("S3_BUCKET")) {
        cfg.bucket = *v;
    }
    if (auto v = env("S3_ENDPOINT")) {
        cfg.endpoint = *v;
    }
    return cfg;
}

aws::aws_credentials load_credentials(const upload_config::env_lookup& env) {
    try {
        return aws::environment_credentials(env);
    } catch (...) {
        std::throw_with_nested(config_error("Cannot load AWS credentials"));
    }
}

aws::aws_credentials load_credentials() {
    try {
        return aws::environment_credentials();
    } catch (...) {
        std::throw_with_nested(config_error("Cannot load AWS credentials"));
    }
}

upload_config upload_config::from_environment() {
    return from_environment([] (std::string_view name) -> std::optional<std::string> {
        if (auto* v = std::getenv(std::string(name).c_str())) {
            return v;
        }
        return std::nullopt;
    });
}

void upload_config::add_options(bpo::options_description& desc) {
    desc.add_options()
        ("region", bpo::value<std::string>(), "S3 region (default: $S3_REGION)")
        ("bucket", bpo::value<std::string>(), "S3 bucket (default: $S3_BUCKET)")
        ("endpoint", bpo::value<std::string>(), "S3 endpoint URL, e.g. http://localhost:9000 (default: $S3_ENDPOINT or the AWS endpoint of the region)")
        ("concurrency", bpo::value<unsigned>()->default_value(default_concurrency), "maximum number of parts uploaded at the same time")
        ("chunk-size", bpo::value<size_t>()->default_value(default_chunk_size), "part size in bytes")
        ("multipart-threshold", bpo::value<size_t>()->default_value(default_multipart_threshold), "files of at least this many bytes are uploaded in parts")
        ("abort-on-failure", bpo::bool_switch()->default_value(false), "abort failed multipart uploads instead of leaving them on the server")
    ;
}

void upload_config::apply_options(const bpo::variables_map& opts) {
    if (opts.count("region")) {
        region = opts["region"].as<std::string>();
    }
    if (opts.count("bucket")) {
        bucket = opts["bucket"].as<std::string>();
    }
    if (opts.count("endpoint")) {
        endpoint = opts["endpoint"].as<std::string>();
    }
    if (opts.count("concurrency")) {
        concurrency_limit = opts["concurrency"].as<unsigned>();
    }
    if (opts.count("chunk-size")) {
        chunk_size = opts["chunk-size"].as<size_t>();
    }
    if (opts.count("multipart-threshold")) {
        multipart_threshold = opts["multipart-threshold"].as<size_t>();
    }
    if (opts.count("abort-on-failure")) {
        abort_on_failure = opts["abort-on-failure"].as<bool>();
    }
}

void upload_config::validate() const {
    if (region.empty()) {
        throw config_error("Either set S3_REGION in the environment or pass --region");
    }
    if (bucket.empty()) {
        throw config_error("Either set S3_BUCKET in the environment or pass --bucket");
    }
    if (concurrency_limit == 0) {
        throw config_error("Concurrency must be at least 1");
    }
    if (chunk_size < minimum_part_size) {
        throw config_error(fmt::format("Chunk size {} is below the minimum part size of {} bytes", chunk_size, minimum_part_size));
    }
    if (multipart_threshold == 0) {
        throw config_error("Multipart threshold must be positive");
    }
}

seastar::sstring upload_config::endpoint_url() const {
    if (!endpoint.empty()) {
        return endpoint;
    }
    return seastar::format("https://s3.{}.amazonaws.com", region);
}

} // namespace s3up
