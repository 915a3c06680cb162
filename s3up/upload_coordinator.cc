/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "s3up/upload_coordinator.hh"

#include <exception>
#include <optional>
#include <stdexcept>

#include <seastar/core/coroutine.hh>
#include <seastar/core/format.hh>
#include <seastar/core/seastar.hh>
#include <seastar/coroutine/exception.hh>

#include "s3up/errors.hh"
#include "s3up/log.hh"

namespace s3up {

seastar::logger upload_log("s3up");

upload_coordinator::upload_coordinator(object_store_client& client, upload_config cfg, upload_progress& progress)
    : _client(client)
    , _cfg(std::move(cfg))
    , _progress(progress)
{}

seastar::future<seastar::file> upload_coordinator::open_source(const std::filesystem::path& path) {
    std::exception_ptr ex;
    std::optional<seastar::directory_entry_type> type;
    try {
        type = co_await seastar::file_type(path.native());
    } catch (...) {
        ex = std::current_exception();
    }
    if (ex) {
        co_return seastar::coroutine::exception(make_nested_exception_ptr(
                validation_error(seastar::format("Cannot access {}", path.native())), std::move(ex)));
    }
    if (!type) {
        throw validation_error(seastar::format("No file exists at path ({})", path.native()));
    }
    if (*type != seastar::directory_entry_type::regular) {
        throw validation_error(seastar::format("Not a regular file ({})", path.native()));
    }

    try {
        co_return co_await seastar::open_file_dma(path.native(), seastar::open_flags::ro);
    } catch (...) {
        ex = std::current_exception();
    }
    co_return seastar::coroutine::exception(make_nested_exception_ptr(
            validation_error(seastar::format("Cannot open {}", path.native())), std::move(ex)));
}

seastar::future<upload_result> upload_coordinator::put_object(seastar::file f, uint64_t size, const upload_request& req) {
    upload_log.debug("Uploading {} ({} bytes) to {} with a single PUT", req.path.native(), size, req.object_key);
    std::exception_ptr ex;
    try {
        auto buf = co_await f.dma_read_exactly<char>(0, size);
        auto res = co_await _client.put_object(req.object_key, req.content_type, _cfg.cache_control, std::move(buf));
        if (res.etag.empty()) {
            throw std::runtime_error("Object store returned no ETag");
        }
        _progress.uploaded += size;
        co_return upload_result{
            .object_key = req.object_key,
            .etag = std::move(res.etag),
            .location = _client.object_url(req.object_key),
        };
    } catch (...) {
        ex = std::current_exception();
    }
    co_return seastar::coroutine::exception(make_nested_exception_ptr(
            upload_error(seastar::format("Failed to upload {} to {}", req.path.native(), req.object_key)), std::move(ex)));
}

seastar::future<upload_result> upload_coordinator::multipart(seastar::file f, uint64_t size, const upload_request& req) {
    multipart_upload mpu(_client, _cfg, _progress, std::move(f), size, req.object_key, req.content_type);
    auto completed = co_await mpu.upload();
    co_return upload_result{
        .object_key = req.object_key,
        .etag = std::move(completed.etag),
        .location = std::move(completed.location),
    };
}

seastar::future<upload_result> upload_coordinator::upload(upload_request req) {
    auto f = co_await open_source(req.path);

    std::exception_ptr ex;
    std::optional<upload_result> res;
    try {
        auto size = co_await f.size();
        if (size == 0) {
            throw validation_error(seastar::format("Unable to upload a zero byte file ({})", req.path.native()));
        }
        _progress.total += size;

        if (size < _cfg.multipart_threshold) {
            res = co_await put_object(f, size, req);
        } else {
            res = co_await multipart(f, size, req);
        }
    } catch (...) {
        ex = std::current_exception();
    }

    co_await f.close();
    if (ex) {
        upload_log.debug("Upload of {} failed: {}", req.path.native(), ex);
        co_return seastar::coroutine::exception(std::move(ex));
    }
    upload_log.info("Uploaded {} to {}", req.path.native(), res->location);
    co_return std::move(*res);
}

} // namespace s3up
