/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "client_utils.hh"

#include <memory>
#include <stdexcept>

#include <fmt/format.h>
#include <seastar/util/log.hh>

#include "utils/s3/aws_error.hh"

static constexpr std::string_view multipart_upload_complete_header = "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\r\n"
                                                                     "<CompleteMultipartUpload xmlns=\"http://s3.amazonaws.com/doc/2006-03-01/\">";

static constexpr std::string_view multipart_upload_complete_entry = "<Part><ETag>{}</ETag><PartNumber>{}</PartNumber></Part>";

static constexpr std::string_view multipart_upload_complete_trailer = "</CompleteMultipartUpload>";

namespace s3 {

using namespace seastar;
extern logger s3l;

sstring parse_multipart_upload_id(sstring& body) {
    auto doc = std::make_unique<rapidxml::xml_document<>>();
    try {
        doc->parse<0>(body.data());
    } catch (const rapidxml::parse_error& e) {
        s3l.warn("cannot parse initiate multipart upload response: {}", e.what());
        return "";
    }
    try {
        return first_node_of(doc.get(), {"InitiateMultipartUploadResult", "UploadId"})->value();
    } catch (const std::runtime_error& e) {
        s3l.warn("unexpected initiate multipart upload response: {}", e.what());
        return "";
    }
}

sstring format_complete_multipart_upload(const std::vector<s3up::part_result>& parts) {
    fmt::memory_buffer body;
    body.append(multipart_upload_complete_header);
    for (const auto& p : parts) {
        fmt::format_to(fmt::appender(body), fmt::runtime(multipart_upload_complete_entry), p.etag, p.part_number);
    }
    body.append(multipart_upload_complete_trailer);
    return sstring(body.data(), body.size());
}

s3up::completed_upload parse_complete_multipart_upload(sstring& body) {
    s3up::completed_upload ret;
    if (body.empty()) {
        return ret;
    }
    if (auto err = s3_error::parse(http::reply::status_type::ok, std::string_view(body.data(), body.size()))) {
        throw std::move(*err);
    }

    auto doc = std::make_unique<rapidxml::xml_document<>>();
    try {
        doc->parse<0>(body.data());
    } catch (const rapidxml::parse_error& e) {
        s3l.warn("cannot parse complete multipart upload response: {}", e.what());
        return ret;
    }
    auto root_node = doc->first_node("CompleteMultipartUploadResult");
    if (!root_node) {
        return ret;
    }
    if (auto location = root_node->first_node("Location")) {
        ret.location = location->value();
    }
    if (auto etag = root_node->first_node("ETag")) {
        ret.etag = etag->value();
    }
    return ret;
}

rapidxml::xml_node<>* first_node_of(rapidxml::xml_node<>* root,
                                           std::initializer_list<std::string_view> names) {
    if (!root) {
        throw std::invalid_argument("no root node");
    }
    auto* node = root;
    for (auto name : names) {
        node = node->first_node(name.data(), name.size());
        if (!node) {
            throw std::runtime_error(fmt::format("'{}' is not found", name));
        }
    }
    return node;
}

} // namespace s3
