/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <exception>
#include <stdexcept>
#include <string>

namespace s3up {

// Base of everything upload_coordinator::upload() throws on its own. Errors
// coming from the object store or the file system are attached as nested
// exceptions (std::throw_with_nested), never replaced.
class upload_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// The file can't be uploaded at all: missing, not a regular file, empty,
// unknown extension or too large for the configured part size. Raised
// before any remote call.
class validation_error : public upload_error {
public:
    using upload_error::upload_error;
};

// Creating the multipart upload failed. No remote state exists.
class session_init_error : public upload_error {
public:
    using upload_error::upload_error;
};

// Reading or uploading one part failed.
class part_upload_error : public upload_error {
    unsigned _part_number;

public:
    part_upload_error(unsigned part_number, const std::string& msg);

    unsigned part_number() const noexcept { return _part_number; }
};

// Every part was uploaded but the object could not be completed. The
// multipart upload is left behind on the remote side.
class completion_error : public upload_error {
public:
    using upload_error::upload_error;
};

class config_error : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

constexpr int exit_failure = 1;
constexpr int exit_invalid_input = 2;

// exit_invalid_input if a validation_error or a config_error is anywhere in
// the std::nested_exception chain of ex, exit_failure otherwise
int exit_code_for(std::exception_ptr ex);

// "outer: nested: innermost"
std::string describe_exception_chain(std::exception_ptr ex);

// Returns `e` with `cause` attached as its nested exception, for code that
// can't use std::throw_with_nested() directly (e.g. a coroutine that has to
// co_await something before rethrowing).
template <typename E>
std::exception_ptr make_nested_exception_ptr(E e, std::exception_ptr cause) {
    std::exception_ptr ret;
    try {
        std::rethrow_exception(std::move(cause));
    } catch (...) {
        try {
            std::throw_with_nested(std::move(e));
        } catch (...) {
            ret = std::current_exception();
        }
    }
    return ret;
}

} // namespace s3up
