/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "utils/s3/aws_error.hh"

#include <memory>

#include <fmt/format.h>
#include <rapidxml.hpp>
#include <seastar/core/format.hh>

namespace s3 {

using namespace seastar;

s3_error::s3_error(http::reply::status_type status, sstring code, sstring message)
    : std::runtime_error(seastar::format("S3 request failed with {} {}: {}", int(status), code, message))
    , _status(status)
    , _code(std::move(code))
    , _message(std::move(message))
{}

std::optional<s3_error> s3_error::parse(http::reply::status_type status, std::string_view body) {
    if (body.empty()) {
        return std::nullopt;
    }

    // rapidxml parses in place
    sstring buf(body.data(), body.size());
    auto doc = std::make_unique<rapidxml::xml_document<>>();
    try {
        doc->parse<0>(buf.data());
    } catch (const rapidxml::parse_error&) {
        return std::nullopt;
    }

    auto error_node = doc->first_node("Error");
    if (!error_node) {
        return std::nullopt;
    }
    auto code_node = error_node->first_node("Code");
    auto message_node = error_node->first_node("Message");
    return s3_error(status,
            code_node ? sstring(code_node->value()) : sstring("Unknown"),
            message_node ? sstring(message_node->value()) : sstring());
}

s3_error s3_error::from_http_code(http::reply::status_type status) {
    switch (status) {
    case http::reply::status_type::unauthorized:
        return s3_error(status, "Unauthorized", "Request is not authorized");
    case http::reply::status_type::forbidden:
        return s3_error(status, "AccessDenied", "Access denied");
    case http::reply::status_type::not_found:
        return s3_error(status, "NotFound", "Resource not found");
    case http::reply::status_type::service_unavailable:
        return s3_error(status, "ServiceUnavailable", "Service is unavailable");
    default:
        return s3_error(status, "Unknown", fmt::format("Unexpected HTTP status {}", int(status)));
    }
}

} // namespace s3
