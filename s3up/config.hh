/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

#include <boost/program_options.hpp>
#include <seastar/core/sstring.hh>

#include "utils/s3/creds.hh"

namespace s3up {

struct upload_config {
    static constexpr unsigned default_concurrency = 8;
    static constexpr size_t default_chunk_size = 10'240'000;
    static constexpr size_t default_multipart_threshold = 5'120'000;
    // "Each part must be at least 5 MB in size, except the last part."
    // https://docs.aws.amazon.com/AmazonS3/latest/API/API_UploadPart.html
    static constexpr size_t minimum_part_size = size_t(5) << 20;
    // "Part numbers can be any number from 1 to 10,000, inclusive."
    static constexpr unsigned maximum_parts = 10'000;

    seastar::sstring region;
    seastar::sstring bucket;
    // Empty means the AWS endpoint of the region
    seastar::sstring endpoint;
    unsigned concurrency_limit = default_concurrency;
    size_t chunk_size = default_chunk_size;
    size_t multipart_threshold = default_multipart_threshold;
    seastar::sstring cache_control = "max-age=315360000, immutable";
    // Issue an abort for multipart uploads that fail after they were
    // created. Off by default, failed uploads are left for a bucket
    // lifecycle rule to collect.
    bool abort_on_failure = false;

    using env_lookup = std::function<std::optional<std::string>(std::string_view)>;

    // Reads S3_REGION, S3_BUCKET and S3_ENDPOINT
    static upload_config from_environment(const env_lookup& env);
    static upload_config from_environment();

    static void add_options(boost::program_options::options_description& desc);
    // Options given on the command line override the environment
    void apply_options(const boost::program_options::variables_map& opts);

    // Throws config_error
    void validate() const;

    seastar::sstring endpoint_url() const;
};

// AWS credentials from the environment, a config_error with the cause nested
// when they are missing
aws::aws_credentials load_credentials(const upload_config::env_lookup& env);
aws::aws_credentials load_credentials();

} // namespace s3up
