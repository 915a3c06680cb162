/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "utils/s3/creds.hh"

#include <cstdlib>
#include <stdexcept>

namespace aws {

aws_credentials environment_credentials(const env_lookup& lookup) {
    aws_credentials creds;
    if (auto v = lookup("AWS_ACCESS_KEY_ID")) {
        creds.access_key_id = *v;
    }
    if (auto v = lookup("AWS_SECRET_ACCESS_KEY")) {
        creds.secret_access_key = *v;
    }
    if (auto v = lookup("AWS_SESSION_TOKEN")) {
        creds.session_token = *v;
    }
    if (!creds) {
        throw std::runtime_error("AWS credentials are not set, export AWS_ACCESS_KEY_ID and AWS_SECRET_ACCESS_KEY");
    }
    return creds;
}

aws_credentials environment_credentials() {
    return environment_credentials([] (std::string_view name) -> std::optional<std::string> {
        if (auto v = std::getenv(std::string(name).c_str())) {
            return std::string(v);
        }
        return std::nullopt;
    });
}

} // namespace aws
