/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <chrono>
#include <map>
#include <string>
#include <string_view>

// AWS Signature Version 4
// https://docs.aws.amazon.com/IAM/latest/UserGuide/reference_sigv-create-signed-request.html
namespace utils::aws {

// The payload hash for requests that don't sign their body
inline constexpr std::string_view unsigned_content = "UNSIGNED-PAYLOAD";

// "20130524T000000Z"
std::string format_time_point(std::chrono::system_clock::time_point tp);

std::string sha256_hex(std::string_view data);

// Percent-encodes everything but the unreserved characters. Slashes are
// kept as is unless encode_slash is set, as needed for object key paths.
std::string uri_encode(std::string_view s, bool encode_slash = true);

// `signed_headers` maps lower case header names to their values, the list
// is the same names joined with ';'. `query_string` must already be in
// canonical form (sorted, encoded, "key=value" joined with '&').
std::string get_signature(std::string_view secret_access_key,
                          std::string_view amz_date,
                          std::string_view canonical_uri,
                          std::string_view method,
                          std::string_view signed_headers_list,
                          const std::map<std::string_view, std::string_view>& signed_headers,
                          std::string_view payload_hash,
                          std::string_view region,
                          std::string_view service,
                          std::string_view query_string);

} // namespace utils::aws
