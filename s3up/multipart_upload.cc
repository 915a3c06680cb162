/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "s3up/multipart_upload.hh"

#include <algorithm>
#include <exception>

#include <seastar/core/coroutine.hh>
#include <seastar/core/format.hh>
#include <seastar/coroutine/exception.hh>

#include "s3up/errors.hh"
#include "s3up/log.hh"
#include "utils/bounded_task_queue.hh"

namespace s3up {

std::string_view to_string(upload_state st) noexcept {
    switch (st) {
    case upload_state::created: return "created";
    case upload_state::initiated: return "initiated";
    case upload_state::parts_in_flight: return "parts_in_flight";
    case upload_state::completing: return "completing";
    case upload_state::completed: return "completed";
    case upload_state::failed: return "failed";
    }
    return "unknown";
}

multipart_upload::multipart_upload(object_store_client& client,
                                   const upload_config& cfg,
                                   upload_progress& progress,
                                   seastar::file file,
                                   uint64_t size,
                                   seastar::sstring key,
                                   seastar::sstring content_type)
    : _client(client)
    , _cfg(cfg)
    , _progress(progress)
    , _file(std::move(file))
    , _size(size)
    , _key(std::move(key))
    , _content_type(std::move(content_type))
{}

void multipart_upload::set_state(upload_state st) {
    upload_log.debug("Multipart upload of {} (upload id {}): {} -> {}", _key, _upload_id, _state, st);
    _state = st;
}

seastar::future<part_result> multipart_upload::upload_part(part_descriptor part) {
    upload_log.trace("Uploading part {} of {} ({} bytes at offset {})", part.number, _parts_count, part.length, part.offset);
    std::exception_ptr ex;
    try {
        auto buf = co_await _file.dma_read_exactly<char>(part.offset, part.length);
        auto etag = co_await _client.upload_part(_key, _upload_id, part.number, std::move(buf));
        if (etag.empty()) {
            throw std::runtime_error("Object store returned no ETag");
        }
        _progress.uploaded += part.length;
        ++_progress.parts_uploaded;
        upload_log.debug("Uploaded part {} of {} ({} bytes), etag {}", part.number, _parts_count, part.length, etag);
        co_return part_result{.part_number = part.number, .etag = std::move(etag)};
    } catch (...) {
        ex = std::current_exception();
    }

    upload_log.debug("Part {} of {} failed: {}", part.number, _parts_count, ex);
    co_return seastar::coroutine::exception(make_nested_exception_ptr(
            part_upload_error(part.number, seastar::format("Failed to upload part {} of {} (upload id {})", part.number, _key, _upload_id)),
            std::move(ex)));
}

seastar::future<> multipart_upload::handle_failure() {
    set_state(upload_state::failed);
    if (!_cfg.abort_on_failure) {
        upload_log.warn("Multipart upload {} of {} failed and is left on the server", _upload_id, _key);
        co_return;
    }

    try {
        co_await _client.abort_multipart_upload(_key, _upload_id);
        upload_log.info("Aborted multipart upload {} of {}", _upload_id, _key);
    } catch (...) {
        // The original error is what the caller needs to see
        upload_log.warn("Failed to abort multipart upload {} of {}: {}", _upload_id, _key, std::current_exception());
    }
}

seastar::future<completed_upload> multipart_upload::upload() {
    if (_state != upload_state::created) {
        throw std::logic_error(seastar::format("Multipart upload of {} already ran", _key));
    }

    auto parts = plan_parts(_size, _cfg.chunk_size);
    if (parts.size() > upload_config::maximum_parts) {
        set_state(upload_state::failed);
        throw validation_error(seastar::format("{} bytes in parts of {} bytes needs {} parts, at most {} are allowed",
                _size, _cfg.chunk_size, parts.size(), upload_config::maximum_parts));
    }
    _parts_count = parts.size();
    _progress.parts_total += _parts_count;

    std::exception_ptr ex;
    try {
        _upload_id = co_await _client.create_multipart_upload(_key, _content_type, _cfg.cache_control);
        if (_upload_id.empty()) {
            throw std::runtime_error("Object store returned no upload id");
        }
    } catch (...) {
        ex = std::current_exception();
    }
    if (ex) {
        // Nothing exists on the server yet, so there is nothing to abort
        set_state(upload_state::failed);
        co_return seastar::coroutine::exception(make_nested_exception_ptr(
                session_init_error(seastar::format("Cannot start multipart upload of {}", _key)), std::move(ex)));
    }
    set_state(upload_state::initiated);

    utils::bounded_task_queue<part_result> queue(_cfg.concurrency_limit);
    for (const auto& part : parts) {
        queue.add([this, part] { return upload_part(part); });
    }

    upload_log.info("Starting upload of {} bytes to {} over {} parts", _size, _key, _parts_count);
    set_state(upload_state::parts_in_flight);
    std::vector<part_result> results;
    try {
        results = co_await queue.execute();
    } catch (...) {
        ex = std::current_exception();
    }
    // Parts that were still running when another one failed must not
    // outlive the file they read from
    co_await queue.close();
    if (ex) {
        co_await handle_failure();
        co_return seastar::coroutine::exception(std::move(ex));
    }

    std::ranges::sort(results, {}, &part_result::part_number);
    upload_log.info("All {} parts of {} uploaded, completing the upload", results.size(), _key);
    set_state(upload_state::completing);
    completed_upload completed;
    try {
        completed = co_await _client.complete_multipart_upload(_key, _upload_id, std::move(results));
    } catch (...) {
        ex = make_nested_exception_ptr(
                completion_error(seastar::format("Cannot complete multipart upload {} of {}", _upload_id, _key)), std::current_exception());
    }
    if (ex) {
        co_await handle_failure();
        co_return seastar::coroutine::exception(std::move(ex));
    }

    set_state(upload_state::completed);
    co_return completed;
}

} // namespace s3up
