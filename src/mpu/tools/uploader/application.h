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

#pragma once

#include "base/seastarx.h"
#include "config/configuration.h"
#include "http/client.h"
#include "upload/source.h"

#include <seastar/core/abort_source.hh>
#include <seastar/core/app-template.hh>
#include <seastar/util/log.hh>

#include <boost/program_options.hpp>

#include <string>

namespace mpu {

namespace po = boost::program_options;

/// Command line uploader: multipart upload of a local file through the
/// configured control endpoints, or a single PUT to a presigned URL.
class application {
public:
    int run(int ac, char** av);

private:
    static ss::app_template::config setup_app_config();
    client_configuration hydrate_config(const po::variables_map& opts);
    int upload(const po::variables_map& opts);
    void upload_whole(
      const client_configuration& cfg,
      http::abstract_client& transport,
      upload_source& source,
      const std::string& url);
    void upload_multipart(
      const client_configuration& cfg,
      http::abstract_client& transport,
      upload_source& source,
      const std::string& metadata);
    void report_progress(double fraction);

    ss::logger _log{"mpu-upload"};
    ss::abort_source _as;
    int _reported_percent{-1};
};

} // namespace mpu
