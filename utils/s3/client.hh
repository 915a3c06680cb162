/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <optional>
#include <string>

#include <seastar/core/future.hh>
#include <seastar/core/shared_ptr.hh>
#include <seastar/core/sstring.hh>
#include <seastar/http/client.hh>
#include <seastar/http/request.hh>

#include "s3up/object_store_client.hh"
#include "utils/s3/creds.hh"

namespace s3 {

struct endpoint_config {
    unsigned port;
    bool use_https;
    seastar::sstring region;
    std::optional<unsigned> max_connections;
    aws::aws_credentials creds;
};

using endpoint_config_ptr = seastar::lw_shared_ptr<endpoint_config>;

// Talks to a single bucket of an S3 compatible endpoint, path-style
class client : public s3up::object_store_client, public seastar::enable_shared_from_this<client> {
    std::string _host;
    endpoint_config_ptr _cfg;
    seastar::sstring _bucket;
    seastar::http::experimental::client _http;

    struct private_tag {};

    seastar::future<> authorize(seastar::http::request& req);
    seastar::future<> make_request(seastar::http::request req,
                                   seastar::http::experimental::client::reply_handler handle,
                                   seastar::http::reply::status_type expected = seastar::http::reply::status_type::ok);
    seastar::sstring host_header() const;
    seastar::sstring object_path(const seastar::sstring& key) const;

public:
    client(std::string host, endpoint_config_ptr cfg, seastar::sstring bucket, private_tag);
    static seastar::shared_ptr<client> make(std::string host, endpoint_config_ptr cfg, seastar::sstring bucket);

    seastar::future<s3up::put_object_result> put_object(seastar::sstring key,
                                                        seastar::sstring content_type,
                                                        seastar::sstring cache_control,
                                                        seastar::temporary_buffer<char> body) override;
    seastar::future<seastar::sstring> create_multipart_upload(seastar::sstring key,
                                                              seastar::sstring content_type,
                                                              seastar::sstring cache_control) override;
    seastar::future<seastar::sstring> upload_part(seastar::sstring key,
                                                  seastar::sstring upload_id,
                                                  unsigned part_number,
                                                  seastar::temporary_buffer<char> body) override;
    seastar::future<s3up::completed_upload> complete_multipart_upload(seastar::sstring key,
                                                                      seastar::sstring upload_id,
                                                                      std::vector<s3up::part_result> parts) override;
    seastar::future<> abort_multipart_upload(seastar::sstring key, seastar::sstring upload_id) override;
    seastar::sstring object_url(const seastar::sstring& key) const override;

    const seastar::sstring& bucket() const noexcept { return _bucket; }

    seastar::future<> close();
};

} // namespace s3
