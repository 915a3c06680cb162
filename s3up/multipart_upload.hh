/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <cstdint>
#include <string_view>

#include <fmt/format.h>
#include <seastar/core/file.hh>
#include <seastar/core/future.hh>
#include <seastar/core/sstring.hh>

#include "s3up/chunk_planner.hh"
#include "s3up/config.hh"
#include "s3up/object_store_client.hh"

namespace s3up {

enum class upload_state {
    created,
    initiated,
    parts_in_flight,
    completing,
    completed,
    failed,
};

std::string_view to_string(upload_state st) noexcept;

struct upload_progress {
    uint64_t total = 0;
    uint64_t uploaded = 0;
    unsigned parts_total = 0;
    unsigned parts_uploaded = 0;
};

// One multipart upload of a file that is already open:
//   created -> initiated -> parts_in_flight -> completing -> completed
// with a transition to failed from any of them.
//
// The parts are read with positioned reads from the one shared file handle,
// each task reads exactly its own range, so any number of them can be in
// flight at the same time. The file is not closed here, it belongs to the
// caller.
class multipart_upload {
    object_store_client& _client;
    const upload_config& _cfg;
    upload_progress& _progress;
    seastar::file _file;
    const uint64_t _size;
    const seastar::sstring _key;
    const seastar::sstring _content_type;
    seastar::sstring _upload_id;
    unsigned _parts_count = 0;
    upload_state _state = upload_state::created;

    void set_state(upload_state st);
    seastar::future<part_result> upload_part(part_descriptor part);
    seastar::future<> handle_failure();

public:
    multipart_upload(object_store_client& client,
                     const upload_config& cfg,
                     upload_progress& progress,
                     seastar::file file,
                     uint64_t size,
                     seastar::sstring key,
                     seastar::sstring content_type);

    // Runs the whole state machine, can only be called once
    seastar::future<completed_upload> upload();

    upload_state state() const noexcept { return _state; }
    const seastar::sstring& upload_id() const noexcept { return _upload_id; }
    unsigned parts_count() const noexcept { return _parts_count; }
};

} // namespace s3up

template <>
struct fmt::formatter<s3up::upload_state> : fmt::formatter<std::string_view> {
    auto format(s3up::upload_state st, fmt::format_context& ctx) const {
        return fmt::formatter<std::string_view>::format(s3up::to_string(st), ctx);
    }
};
