/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <optional>
#include <stdexcept>
#include <string_view>

#include <seastar/core/sstring.hh>
#include <seastar/http/reply.hh>

namespace s3 {

// A non-success reply from the object store
class s3_error : public std::runtime_error {
    seastar::http::reply::status_type _status;
    seastar::sstring _code;
    seastar::sstring _message;

public:
    s3_error(seastar::http::reply::status_type status, seastar::sstring code, seastar::sstring message);

    seastar::http::reply::status_type status() const noexcept { return _status; }
    const seastar::sstring& code() const noexcept { return _code; }
    const seastar::sstring& message() const noexcept { return _message; }

    // Builds the error out of an <Error> document, nullopt if the body
    // is not one. Also used for 200 replies that carry an error.
    static std::optional<s3_error> parse(seastar::http::reply::status_type status, std::string_view body);
    static s3_error from_http_code(seastar::http::reply::status_type status);
};

} // namespace s3
