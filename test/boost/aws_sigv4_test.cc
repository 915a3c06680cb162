/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#define BOOST_TEST_MODULE aws_sigv4

#include <chrono>
#include <map>
#include <string_view>

#include <boost/test/unit_test.hpp>

#include "utils/aws_sigv4.hh"

// Examples from "Signature Calculations for the Authorization Header"
// https://docs.aws.amazon.com/AmazonS3/latest/API/sig-v4-header-based-auth.html

static constexpr std::string_view example_secret = "wJalrXUtnFEMI/K7MDENG/bPxRfiCYEXAMPLEKEY";
static constexpr std::string_view example_date = "20130524T000000Z";
static constexpr std::string_view example_host = "examplebucket.s3.amazonaws.com";
static constexpr std::string_view empty_payload_hash = "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";

BOOST_AUTO_TEST_CASE(test_sha256_of_empty_payload) {
    BOOST_REQUIRE_EQUAL(utils::aws::sha256_hex(""), empty_payload_hash);
}

BOOST_AUTO_TEST_CASE(test_get_object_signature) {
    std::map<std::string_view, std::string_view> headers{
        {"host", example_host},
        {"range", "bytes=0-9"},
        {"x-amz-content-sha256", empty_payload_hash},
        {"x-amz-date", example_date},
    };
    auto sig = utils::aws::get_signature(example_secret, example_date, "/test.txt", "GET",
            "host;range;x-amz-content-sha256;x-amz-date", headers,
            empty_payload_hash, "us-east-1", "s3", "");
    BOOST_REQUIRE_EQUAL(sig, "f0e8bdb87c964420e857bd35b5d6ed310bd44f0170aba48dd91039c6036bdb41");
}

BOOST_AUTO_TEST_CASE(test_get_bucket_lifecycle_signature) {
    std::map<std::string_view, std::string_view> headers{
        {"host", example_host},
        {"x-amz-content-sha256", empty_payload_hash},
        {"x-amz-date", example_date},
    };
    auto sig = utils::aws::get_signature(example_secret, example_date, "/", "GET",
            "host;x-amz-content-sha256;x-amz-date", headers,
            empty_payload_hash, "us-east-1", "s3", "lifecycle=");
    BOOST_REQUIRE_EQUAL(sig, "fea454ca298b7da1c68078a5d1bdbfbbe0d65c699e0f91ac7a200a0136783543");
}

BOOST_AUTO_TEST_CASE(test_list_objects_signature) {
    std::map<std::string_view, std::string_view> headers{
        {"host", example_host},
        {"x-amz-content-sha256", empty_payload_hash},
        {"x-amz-date", example_date},
    };
    auto sig = utils::aws::get_signature(example_secret, example_date, "/", "GET",
            "host;x-amz-content-sha256;x-amz-date", headers,
            empty_payload_hash, "us-east-1", "s3", "max-keys=2&prefix=J");
    BOOST_REQUIRE_EQUAL(sig, "34b48302e7b5fa45bde8084f4b7868a86f0a534bc59db6670ed5711ef69dc6f7");
}

BOOST_AUTO_TEST_CASE(test_signature_depends_on_region) {
    std::map<std::string_view, std::string_view> headers{{"host", example_host}};
    auto a = utils::aws::get_signature(example_secret, example_date, "/k", "PUT", "host", headers,
            utils::aws::unsigned_content, "us-east-1", "s3", "");
    auto b = utils::aws::get_signature(example_secret, example_date, "/k", "PUT", "host", headers,
            utils::aws::unsigned_content, "eu-west-1", "s3", "");
    BOOST_REQUIRE_EQUAL(a.size(), 64);
    BOOST_REQUIRE_NE(a, b);
}

BOOST_AUTO_TEST_CASE(test_malformed_date) {
    std::map<std::string_view, std::string_view> headers;
    BOOST_REQUIRE_THROW(utils::aws::get_signature(example_secret, "2013", "/", "GET", "", headers,
            utils::aws::unsigned_content, "us-east-1", "s3", ""), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(test_format_time_point) {
    // 2013-05-24T00:00:00Z
    auto tp = std::chrono::system_clock::time_point(std::chrono::seconds(1369353600));
    BOOST_REQUIRE_EQUAL(utils::aws::format_time_point(tp), example_date);
}

BOOST_AUTO_TEST_CASE(test_uri_encode) {
    BOOST_REQUIRE_EQUAL(utils::aws::uri_encode("AZaz09-_.~"), "AZaz09-_.~");
    BOOST_REQUIRE_EQUAL(utils::aws::uri_encode("a b+c"), "a%20b%2Bc");
    BOOST_REQUIRE_EQUAL(utils::aws::uri_encode("ab/cd/e.png"), "ab%2Fcd%2Fe.png");
    BOOST_REQUIRE_EQUAL(utils::aws::uri_encode("ab/cd/e.png", false), "ab/cd/e.png");
    BOOST_REQUIRE_EQUAL(utils::aws::uri_encode("\xc3\xa9"), "%C3%A9");
}
