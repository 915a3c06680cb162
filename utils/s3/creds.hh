/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>

#include <seastar/core/sstring.hh>

namespace aws {

struct aws_credentials {
    seastar::sstring access_key_id;
    seastar::sstring secret_access_key;
    seastar::sstring session_token;

    explicit operator bool() const { return !access_key_id.empty() && !secret_access_key.empty(); }
};

using env_lookup = std::function<std::optional<std::string>(std::string_view)>;

// AWS_ACCESS_KEY_ID, AWS_SECRET_ACCESS_KEY and the optional AWS_SESSION_TOKEN.
// Throws std::runtime_error when the key pair is incomplete.
aws_credentials environment_credentials(const env_lookup& lookup);
aws_credentials environment_credentials();

} // namespace aws
