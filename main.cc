/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include <exception>
#include <filesystem>

#include <boost/program_options.hpp>
#include <fmt/format.h>
#include <seastar/core/app-template.hh>
#include <seastar/core/coroutine.hh>
#include <seastar/core/shared_ptr.hh>
#include <seastar/util/log.hh>

#include "s3up/config.hh"
#include "s3up/content_types.hh"
#include "s3up/errors.hh"
#include "s3up/log.hh"
#include "s3up/object_key.hh"
#include "s3up/upload_coordinator.hh"
#include "utils/http.hh"
#include "utils/s3/client.hh"

using namespace seastar;
namespace bpo = boost::program_options;

static s3::endpoint_config_ptr make_endpoint_config(const s3up::upload_config& cfg, const utils::http::url_info& url) {
    return make_lw_shared<s3::endpoint_config>(s3::endpoint_config{
        .port = url.port,
        .use_https = url.is_https(),
        .region = cfg.region,
        .max_connections = cfg.concurrency_limit,
        .creds = s3up::load_credentials(),
    });
}

static utils::http::url_info parse_endpoint(const s3up::upload_config& cfg) {
    auto endpoint = cfg.endpoint_url();
    try {
        return utils::http::parse_simple_url(endpoint);
    } catch (...) {
        std::throw_with_nested(s3up::config_error(fmt::format("Invalid endpoint {}", endpoint)));
    }
}

static future<s3up::upload_result> upload_file(const s3up::upload_config& cfg, std::filesystem::path path) {
    auto ext = s3up::content_type_for(path.filename().native());
    if (!ext) {
        throw s3up::validation_error(fmt::format("Unsupported file type: {}", path.filename().native()));
    }
    auto url = parse_endpoint(cfg);
    auto client = s3::client::make(url.host, make_endpoint_config(cfg, url), cfg.bucket);

    s3up::upload_progress progress;
    s3up::upload_coordinator coordinator(*client, cfg, progress);
    s3up::upload_request req{
        .path = std::move(path),
        .object_key = s3up::generate_object_key(ext->extension),
        .content_type = sstring(ext->content_type.data(), ext->content_type.size()),
    };
    s3up::upload_log.info("Uploading {} as {} ({})", req.path.native(), req.object_key, req.content_type);

    std::exception_ptr ex;
    s3up::upload_result res;
    try {
        res = co_await coordinator.upload(std::move(req));
    } catch (...) {
        ex = std::current_exception();
    }
    co_await client->close();
    if (ex) {
        co_await coroutine::return_exception_ptr(std::move(ex));
    }
    s3up::upload_log.debug("Uploaded {}/{} bytes in {} parts", progress.uploaded, progress.total, progress.parts_uploaded);
    co_return res;
}

static future<int> run(const bpo::variables_map& opts) {
    std::exception_ptr ex;
    try {
        auto cfg = s3up::upload_config::from_environment();
        cfg.apply_options(opts);
        cfg.validate();
        if (!opts.count("file")) {
            throw s3up::config_error("No file to upload was given");
        }
        auto res = co_await upload_file(cfg, opts["file"].as<sstring>().c_str());
        fmt::print("Success: {}\n", res.location);
        co_return 0;
    } catch (...) {
        ex = std::current_exception();
    }
    s3up::upload_log.error("Upload failed: {}", s3up::describe_exception_chain(ex));
    co_return s3up::exit_code_for(std::move(ex));
}

int main(int ac, char** av) {
    app_template::config app_cfg;
    app_cfg.name = "s3up";
    app_cfg.description = "Uploads a file to S3, in concurrent parts when it is large.\n"
                          "Credentials are taken from AWS_ACCESS_KEY_ID, AWS_SECRET_ACCESS_KEY\n"
                          "and AWS_SESSION_TOKEN.";
    app_template app(std::move(app_cfg));
    s3up::upload_config::add_options(app.get_options_description());
    app.add_positional_options({
        {"file", bpo::value<sstring>(), "file to upload", 1},
    });

    return app.run(ac, av, [&app] () -> future<int> {
        return run(app.configuration());
    });
}
