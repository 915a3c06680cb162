/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <initializer_list>
#include <string_view>
#include <vector>

#include <rapidxml.hpp>
#include <seastar/core/sstring.hh>

#include "s3up/object_store_client.hh"

namespace s3 {

// Empty when the body can't be parsed, the caller decides how to fail
seastar::sstring parse_multipart_upload_id(seastar::sstring& body);

// The CompleteMultipartUpload manifest, parts in the given order
seastar::sstring format_complete_multipart_upload(const std::vector<s3up::part_result>& parts);

// CompleteMultipartUpload may answer 200 with an <Error> body, that case
// throws s3_error. Missing Location or ETag leave the fields empty.
s3up::completed_upload parse_complete_multipart_upload(seastar::sstring& body);

rapidxml::xml_node<>* first_node_of(rapidxml::xml_node<>* root, std::initializer_list<std::string_view> names);

} // namespace s3
