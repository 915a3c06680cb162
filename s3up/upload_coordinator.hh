/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <cstdint>
#include <filesystem>

#include <seastar/core/file.hh>
#include <seastar/core/future.hh>
#include <seastar/core/sstring.hh>

#include "s3up/config.hh"
#include "s3up/multipart_upload.hh"
#include "s3up/object_store_client.hh"

namespace s3up {

struct upload_request {
    std::filesystem::path path;
    seastar::sstring object_key;
    seastar::sstring content_type;
};

struct upload_result {
    seastar::sstring object_key;
    seastar::sstring etag;
    seastar::sstring location;
};

// Uploads local files, with a single PUT below the multipart threshold and
// with a concurrent multipart upload from it on.
class upload_coordinator {
    object_store_client& _client;
    const upload_config _cfg;
    upload_progress& _progress;

    seastar::future<seastar::file> open_source(const std::filesystem::path& path);
    seastar::future<upload_result> put_object(seastar::file f, uint64_t size, const upload_request& req);
    seastar::future<upload_result> multipart(seastar::file f, uint64_t size, const upload_request& req);

public:
    upload_coordinator(object_store_client& client, upload_config cfg, upload_progress& progress);

    // Fails with validation_error, session_init_error, part_upload_error,
    // completion_error, or upload_error for a failed single PUT. The cause
    // is attached as a nested exception.
    seastar::future<upload_result> upload(upload_request req);

    const upload_config& config() const noexcept { return _cfg; }
};

} // namespace s3up
