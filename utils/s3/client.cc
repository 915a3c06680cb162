/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include <chrono>
#include <exception>
#include <map>
#include <memory>
#include <fmt/format.h>
#include <seastar/core/coroutine.hh>
#include <seastar/core/iostream.hh>
#include <seastar/core/temporary_buffer.hh>
#include <seastar/coroutine/exception.hh>
#include <seastar/http/exception.hh>
#include <seastar/http/reply.hh>
#include <seastar/http/url.hh>
#include <seastar/util/log.hh>
#include <seastar/util/short_streams.hh>
#include "utils/s3/aws_error.hh"
#include "utils/s3/client.hh"
#include "utils/s3/utils/client_utils.hh"
#include "utils/aws_sigv4.hh"
#include "utils/http.hh"

namespace s3 {

using namespace seastar;

logger s3l("s3");

static future<> ignore_reply(const http::reply& rep, input_stream<char>&& in_) {
    auto in = std::move(in_);
    co_await util::skip_entire_stream(in);
}

static auto body_writer(temporary_buffer<char> body) {
    return [body = std::move(body)] (output_stream<char>&& out_) -> future<> {
        auto out = std::move(out_);
        std::exception_ptr ex;
        try {
            co_await out.write(body.get(), body.size());
            co_await out.flush();
        } catch (...) {
            ex = std::current_exception();
        }
        co_await out.close();
        if (ex) {
            co_await coroutine::return_exception_ptr(std::move(ex));
        }
    };
}

client::client(std::string host, endpoint_config_ptr cfg, sstring bucket, private_tag)
        : _host(std::move(host))
        , _cfg(std::move(cfg))
        , _bucket(std::move(bucket))
        , _http(std::make_unique<utils::http::dns_connection_factory>(_host, _cfg->port, _cfg->use_https, s3l),
                _cfg->max_connections.value_or(1))
{}

shared_ptr<client> client::make(std::string host, endpoint_config_ptr cfg, sstring bucket) {
    return seastar::make_shared<client>(std::move(host), std::move(cfg), std::move(bucket), private_tag{});
}

sstring client::host_header() const {
    unsigned default_port = _cfg->use_https ? 443 : 80;
    if (_cfg->port == default_port) {
        return _host;
    }
    return seastar::format("{}:{}", _host, _cfg->port);
}

sstring client::object_path(const sstring& key) const {
    return seastar::format("/{}/{}", _bucket, utils::aws::uri_encode(key, false));
}

future<> client::authorize(http::request& req) {
    const auto& creds = _cfg->creds;
    auto time_point_str = utils::aws::format_time_point(std::chrono::system_clock::now());
    auto time_point_st = time_point_str.substr(0, 8);
    req._headers["x-amz-date"] = time_point_str;
    req._headers["x-amz-content-sha256"] = sstring(utils::aws::unsigned_content.data(), utils::aws::unsigned_content.size());
    if (!creds.session_token.empty()) {
        req._headers["x-amz-security-token"] = creds.session_token;
    }
    std::map<std::string_view, std::string_view> signed_headers;
    sstring signed_headers_list = "";
    // AWS requires all x-... and Host: headers to be signed
    signed_headers["host"] = req._headers["Host"];
    for (const auto& [name, value] : req._headers) {
        if (name.starts_with("x-")) {
            signed_headers[name] = value;
        }
    }
    unsigned header_nr = signed_headers.size();
    for (const auto& h : signed_headers) {
        signed_headers_list += seastar::format("{}{}", h.first, header_nr == 1 ? "" : ";");
        header_nr--;
    }
    sstring query_string = "";
    std::map<std::string_view, std::string_view> query_parameters;
    for (const auto& q : req.query_parameters) {
        query_parameters[q.first] = q.second;
    }
    unsigned query_nr = query_parameters.size();
    for (const auto& q : query_parameters) {
        query_string += seastar::format("{}={}{}", http::internal::url_encode(q.first), http::internal::url_encode(q.second), query_nr == 1 ? "" : "&");
        query_nr--;
    }
    auto sig = utils::aws::get_signature(
        creds.secret_access_key, time_point_str,
        req._url, req._method,
        signed_headers_list, signed_headers,
        utils::aws::unsigned_content,
        _cfg->region, "s3", query_string);
    req._headers["Authorization"] = seastar::format("AWS4-HMAC-SHA256 Credential={}/{}/{}/s3/aws4_request,SignedHeaders={},Signature={}", creds.access_key_id, time_point_st, _cfg->region, signed_headers_list, sig);
    co_return;
}

future<> client::make_request(http::request req, http::experimental::client::reply_handler handle, http::reply::status_type expected) {
    co_await authorize(req);
    co_await _http.make_request(std::move(req),
        [handler = std::move(handle), expected] (const http::reply& rep, input_stream<char>&& in) mutable -> future<> {
            auto payload = std::move(in);
            auto status_class = http::reply::classify_status(rep._status);

            if (status_class != http::reply::status_class::informational && status_class != http::reply::status_class::success) {
                auto body = co_await util::read_entire_stream_contiguous(payload);
                auto possible_error = s3_error::parse(rep._status, std::string_view(body.data(), body.size()));
                if (possible_error) {
                    co_await coroutine::return_exception(std::move(*possible_error));
                }
                co_await coroutine::return_exception(s3_error::from_http_code(rep._status));
            }

            if (rep._status != expected) {
                co_await coroutine::return_exception(httpd::unexpected_status_error(rep._status));
            }
            co_await handler(rep, std::move(payload));
        });
}

future<s3up::put_object_result> client::put_object(sstring key, sstring content_type, sstring cache_control, temporary_buffer<char> body) {
    s3l.trace("PUT {} ({} bytes)", key, body.size());
    auto req = http::request::make("PUT", host_header(), object_path(key));
    auto len = body.size();
    req.write_body("bin", len, body_writer(std::move(body)));
    req._headers["Content-Type"] = std::move(content_type);
    req._headers["Cache-Control"] = std::move(cache_control);

    s3up::put_object_result ret;
    co_await make_request(std::move(req), [&ret] (const http::reply& rep, input_stream<char>&& in) {
        ret.etag = rep.get_header("ETag");
        return ignore_reply(rep, std::move(in));
    });
    co_return ret;
}

future<sstring> client::create_multipart_upload(sstring key, sstring content_type, sstring cache_control) {
    s3l.trace("POST {} uploads", key);
    auto req = http::request::make("POST", host_header(), object_path(key));
    req.query_parameters["uploads"] = "";
    req._headers["Content-Type"] = std::move(content_type);
    req._headers["Cache-Control"] = std::move(cache_control);

    sstring upload_id;
    co_await make_request(std::move(req), [&upload_id] (const http::reply& rep, input_stream<char>&& in_) -> future<> {
        auto in = std::move(in_);
        auto body = co_await util::read_entire_stream_contiguous(in);
        upload_id = parse_multipart_upload_id(body);
    });
    s3l.trace("created upload {} for {}", upload_id, key);
    co_return upload_id;
}

future<sstring> client::upload_part(sstring key, sstring upload_id, unsigned part_number, temporary_buffer<char> body) {
    s3l.trace("PUT {} part {} ({} bytes) of upload {}", key, part_number, body.size(), upload_id);
    auto req = http::request::make("PUT", host_header(), object_path(key));
    req.query_parameters["partNumber"] = seastar::format("{}", part_number);
    req.query_parameters["uploadId"] = std::move(upload_id);
    auto len = body.size();
    req.write_body("bin", len, body_writer(std::move(body)));

    sstring etag;
    co_await make_request(std::move(req), [&etag] (const http::reply& rep, input_stream<char>&& in) {
        etag = rep.get_header("ETag");
        return ignore_reply(rep, std::move(in));
    });
    co_return etag;
}

future<s3up::completed_upload> client::complete_multipart_upload(sstring key, sstring upload_id, std::vector<s3up::part_result> parts) {
    s3l.trace("POST {} complete upload {} ({} parts)", key, upload_id, parts.size());
    auto req = http::request::make("POST", host_header(), object_path(key));
    req.query_parameters["uploadId"] = std::move(upload_id);
    auto manifest = format_complete_multipart_upload(parts);
    auto len = manifest.size();
    req.write_body("xml", len, body_writer(temporary_buffer<char>(manifest.data(), manifest.size())));

    s3up::completed_upload ret;
    co_await make_request(std::move(req), [&ret] (const http::reply& rep, input_stream<char>&& in_) -> future<> {
        auto in = std::move(in_);
        auto body = co_await util::read_entire_stream_contiguous(in);
        ret = parse_complete_multipart_upload(body);
    });
    if (ret.location.empty()) {
        ret.location = object_url(key);
    }
    co_return ret;
}

future<> client::abort_multipart_upload(sstring key, sstring upload_id) {
    s3l.trace("DELETE {} upload {}", key, upload_id);
    auto req = http::request::make("DELETE", host_header(), object_path(key));
    req.query_parameters["uploadId"] = std::move(upload_id);
    co_await make_request(std::move(req), ignore_reply, http::reply::status_type::no_content);
}

sstring client::object_url(const sstring& key) const {
    auto encoded_key = utils::aws::uri_encode(key, false);
    if (_host.ends_with(".amazonaws.com")) {
        return seastar::format("https://{}.s3.{}.amazonaws.com/{}", _bucket, _cfg->region, encoded_key);
    }
    return seastar::format("{}://{}:{}/{}/{}", _cfg->use_https ? "https" : "http", _host, _cfg->port, _bucket, encoded_key);
}

future<> client::close() {
    co_await _http.close();
}

} // s3 namespace
