/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#define BOOST_TEST_MODULE errors

#include <exception>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>

#include <boost/test/unit_test.hpp>

#include "s3up/config.hh"
#include "s3up/errors.hh"
#include "utils/s3/aws_error.hh"

using namespace seastar;

namespace {

template <typename Func>
std::exception_ptr catch_exception(Func&& func) {
    try {
        func();
    } catch (...) {
        return std::current_exception();
    }
    BOOST_FAIL("expected an exception");
    return nullptr;
}

s3up::upload_config::env_lookup make_env(std::map<std::string, std::string> vars) {
    return [vars = std::move(vars)] (std::string_view name) -> std::optional<std::string> {
        auto it = vars.find(std::string(name));
        if (it == vars.end()) {
            return std::nullopt;
        }
        return it->second;
    };
}

}

BOOST_AUTO_TEST_CASE(test_validation_error_is_invalid_input) {
    auto ex = std::make_exception_ptr(s3up::validation_error("Unable to upload a zero byte file (empty.txt)"));
    BOOST_REQUIRE_EQUAL(s3up::exit_code_for(ex), s3up::exit_invalid_input);
}

BOOST_AUTO_TEST_CASE(test_missing_credentials_are_invalid_input) {
    auto ex = catch_exception([] {
        s3up::load_credentials(make_env({{"AWS_ACCESS_KEY_ID", "AKIDEXAMPLE"}}));
    });
    BOOST_REQUIRE_EQUAL(s3up::exit_code_for(ex), s3up::exit_invalid_input);

    auto what = s3up::describe_exception_chain(ex);
    BOOST_REQUIRE(what.starts_with("Cannot load AWS credentials: "));
    BOOST_REQUIRE(what.find("AWS_SECRET_ACCESS_KEY") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(test_complete_credentials) {
    auto creds = s3up::load_credentials(make_env({
        {"AWS_ACCESS_KEY_ID", "AKIDEXAMPLE"},
        {"AWS_SECRET_ACCESS_KEY", "secret"},
    }));
    BOOST_REQUIRE_EQUAL(creds.access_key_id, "AKIDEXAMPLE");
    BOOST_REQUIRE_EQUAL(creds.secret_access_key, "secret");
    BOOST_REQUIRE(creds.session_token.empty());
}

BOOST_AUTO_TEST_CASE(test_remote_failure_is_a_plain_failure) {
    auto ex = catch_exception([] {
        try {
            throw s3::s3_error(http::reply::status_type::forbidden, "AccessDenied", "Access Denied");
        } catch (...) {
            std::throw_with_nested(s3up::part_upload_error(3, "Failed to upload part 3 of a/b/c.png (upload id u-1)"));
        }
    });
    BOOST_REQUIRE_EQUAL(s3up::exit_code_for(ex), s3up::exit_failure);
    BOOST_REQUIRE_EQUAL(s3up::describe_exception_chain(ex),
            "Failed to upload part 3 of a/b/c.png (upload id u-1): S3 request failed with 403 AccessDenied: Access Denied");
}

BOOST_AUTO_TEST_CASE(test_nested_validation_error_is_invalid_input) {
    auto ex = s3up::make_nested_exception_ptr(s3up::validation_error("Cannot open movie.mp4"),
            std::make_exception_ptr(std::runtime_error("Permission denied")));
    BOOST_REQUIRE_EQUAL(s3up::exit_code_for(ex), s3up::exit_invalid_input);
    BOOST_REQUIRE_EQUAL(s3up::describe_exception_chain(ex), "Cannot open movie.mp4: Permission denied");

    auto wrapped = s3up::make_nested_exception_ptr(std::runtime_error("Upload failed"), ex);
    BOOST_REQUIRE_EQUAL(s3up::exit_code_for(wrapped), s3up::exit_invalid_input);
}

BOOST_AUTO_TEST_CASE(test_non_std_exceptions) {
    auto ex = std::make_exception_ptr(42);
    BOOST_REQUIRE_EQUAL(s3up::exit_code_for(ex), s3up::exit_failure);
    BOOST_REQUIRE_EQUAL(s3up::describe_exception_chain(ex), "unknown exception");
    BOOST_REQUIRE_EQUAL(s3up::describe_exception_chain(nullptr), "");
}
