/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <vector>

#include <seastar/core/future.hh>
#include <seastar/core/sstring.hh>
#include <seastar/core/temporary_buffer.hh>

namespace s3up {

struct part_result {
    unsigned part_number;
    seastar::sstring etag;

    bool operator==(const part_result&) const = default;
};

struct put_object_result {
    seastar::sstring etag;
};

struct completed_upload {
    seastar::sstring etag;
    seastar::sstring location;
};

// The remote object store, as seen by the upload coordinator. Every call may
// fail with whatever exception the implementation uses; the coordinator
// attaches it to its own error types.
class object_store_client {
public:
    virtual ~object_store_client() = default;

    virtual seastar::future<put_object_result> put_object(seastar::sstring key,
                                                          seastar::sstring content_type,
                                                          seastar::sstring cache_control,
                                                          seastar::temporary_buffer<char> body) = 0;

    // Returns the upload id
    virtual seastar::future<seastar::sstring> create_multipart_upload(seastar::sstring key,
                                                                      seastar::sstring content_type,
                                                                      seastar::sstring cache_control) = 0;

    // Returns the part's ETag
    virtual seastar::future<seastar::sstring> upload_part(seastar::sstring key,
                                                          seastar::sstring upload_id,
                                                          unsigned part_number,
                                                          seastar::temporary_buffer<char> body) = 0;

    // Parts must be listed in ascending part number order
    virtual seastar::future<completed_upload> complete_multipart_upload(seastar::sstring key,
                                                                        seastar::sstring upload_id,
                                                                        std::vector<part_result> parts) = 0;

    virtual seastar::future<> abort_multipart_upload(seastar::sstring key, seastar::sstring upload_id) = 0;

    // Where an object written with put_object() can be fetched from
    virtual seastar::sstring object_url(const seastar::sstring& key) const = 0;
};

} // namespace s3up
