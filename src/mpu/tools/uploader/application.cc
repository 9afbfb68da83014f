/*
 * Copyright 2024 Redpanda Data, Inc.
 *
 * Use of this software is governed by the Business Source License
 * included in the file licenses/BSL.md
 *
 * As of the Change Date specified in that file, in accordance with
 * the Business Source License, use of this software will be governed
 * by the Apache License, Version 2.0
 */

#include "tools/uploader/application.h"

#include "base/vlog.h"
#include "http/client.h"
#include "upload/errors.h"
#include "upload/http_control_channel.h"
#include "upload/orchestrator.h"
#include "upload/part_transport.h"
#include "upload/source.h"

#include <seastar/core/reactor.hh>
#include <seastar/core/thread.hh>

#include <csignal>
#include <iostream>
#include <string>

namespace mpu {

int application::run(int ac, char** av) {
    ss::app_template app(setup_app_config());
    app.add_options()(
      "config", po::value<std::string>()->required(), ".yaml uploader config");
    app.add_options()(
      "file", po::value<std::string>()->required(), "file to upload");
    app.add_options()(
      "name", po::value<std::string>(), "object name, file name by default");
    app.add_options()(
      "content-type",
      po::value<std::string>()->default_value(default_content_type),
      "content type of the object");
    app.add_options()(
      "metadata",
      po::value<std::string>()->default_value(""),
      "JSON metadata sent with the create call");
    app.add_options()(
      "part-size", po::value<int64_t>(), "override of mpu.part_size");
    app.add_options()(
      "concurrency", po::value<int>(), "override of mpu.concurrency");
    app.add_options()(
      "retry", po::value<int>(), "attempts per part, override of mpu.retry");
    app.add_options()(
      "put-url",
      po::value<std::string>(),
      "upload the whole file with one PUT to this presigned URL");

    return app.run(ac, av, [this, &app] {
        return ss::async([this, &app] {
            const auto& opts = app.configuration();
            ss::engine().handle_signal(SIGINT, [this] {
                if (!_as.abort_requested()) {
                    mlog(_log.info, "Interrupted, cancelling upload");
                    _as.request_abort();
                }
            });
            auto rc = upload(opts);
            ss::engine().handle_signal(SIGINT, [] {});
            return rc;
        });
    });
}

ss::app_template::config application::setup_app_config() {
    ss::app_template::config app_cfg;
    app_cfg.name = "mpu-upload";
    app_cfg.auto_handle_sigint_sigterm = false;
    return app_cfg;
}

client_configuration
application::hydrate_config(const po::variables_map& opts) {
    auto cfg = client_configuration::load_file(opts["config"].as<std::string>())
                 .get();
    if (opts.count("part-size")) {
        cfg.part_size = opts["part-size"].as<int64_t>();
    }
    if (opts.count("concurrency")) {
        cfg.concurrency = opts["concurrency"].as<int>();
    }
    if (opts.count("retry")) {
        cfg.retry = opts["retry"].as<int>();
    }
    mlog(_log.info, "Configuration: {}", cfg);
    return cfg;
}

void application::report_progress(double fraction) {
    auto percent = static_cast<int>(fraction * 100);
    if (percent / 10 != _reported_percent / 10) {
        _reported_percent = percent;
        mlog(_log.info, "Uploaded {}%", percent);
    }
}

int application::upload(const po::variables_map& opts) {
    client_configuration cfg;
    try {
        cfg = hydrate_config(opts);
    } catch (const std::exception& e) {
        mlog(_log.error, "Invalid configuration: {}", e.what());
        return 1;
    }

    std::optional<ss::sstring> name;
    if (opts.count("name")) {
        name = ss::sstring(opts["name"].as<std::string>());
    }
    auto source = file_source::open(
                    ss::sstring(opts["file"].as<std::string>()),
                    std::move(name),
                    ss::sstring(opts["content-type"].as<std::string>()))
                    .get();
    http::client transport(http::client::configuration{.ca_file = cfg.ca_file});

    int rc = 1;
    try {
        if (opts.count("put-url")) {
            upload_whole(
              cfg, transport, *source, opts["put-url"].as<std::string>());
        } else {
            upload_multipart(
              cfg, transport, *source, opts["metadata"].as<std::string>());
        }
        rc = 0;
    } catch (const upload_error& e) {
        mlog(_log.error, "Upload of {} failed: {}", source->name(), e.what());
    } catch (const std::exception& e) {
        mlog(_log.error, "Unexpected failure: {}", e.what());
    }
    source->close().get();
    transport.stop().get();
    return rc;
}

void application::upload_whole(
  const client_configuration& cfg,
  http::abstract_client& transport,
  upload_source& source,
  const std::string& url) {
    auto bytes = source.read(0, source.size()).get();
    auto res = upload_object(
                 transport,
                 object_upload_request{
                   .url = ss::sstring(url),
                   .bytes = std::move(bytes),
                   .content_type = source.content_type(),
                   .as = &_as,
                   .on_progress =
                     [this, size = source.size()](size_t sent) {
                         report_progress(
                           static_cast<double>(sent)
                           / static_cast<double>(size));
                     }},
                 retry_options{
                   .max_attempts = resolve_max_attempts(cfg.retry),
                   .policy = cfg.policy})
                 .get();
    std::cout << "uploaded " << source.name() << ", HTTP " << res.status
              << ", etag " << res.etag.value_or("-") << std::endl;
}

void application::upload_multipart(
  const client_configuration& cfg,
  http::abstract_client& transport,
  upload_source& source,
  const std::string& metadata) {
    http_control_channel control(transport, cfg.control);
    auto mcfg = cfg.make_multipart_config();
    mcfg.as = &_as;
    mcfg.on_progress = [this](double f) { report_progress(f); };
    auto result = execute_multipart_upload(
                    control,
                    transport,
                    source,
                    ss::sstring(metadata),
                    std::move(mcfg))
                    .get();
    std::cout << result << std::endl;
}

} // namespace mpu
