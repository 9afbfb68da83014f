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
#include "upload/http_control_channel.h"
#include "upload/types.h"
#include "utils/retry.h"

#include <seastar/core/sstring.hh>

#include <yaml-cpp/yaml.h>

#include <chrono>
#include <iosfwd>
#include <optional>
#include <string_view>

namespace mpu {

/// Settings of the uploader, read from the `mpu` node of a YAML document:
///
///   mpu:
///     endpoint: https://storage.example.com/api/storage
///     headers: {Authorization: "Bearer ..."}
///     part_size: 10485760
///     concurrency: 4
///     retry: true
///     retry_policy: {base_delay_ms: 1000, max_delay_ms: 30000}
///     encryption: {type: SSE-KMS, key_id: alias/uploads}
struct client_configuration {
    control_endpoints control;
    int64_t part_size{default_part_size};
    int concurrency{default_concurrency};
    int presign_batch_size{default_presign_batch_size};
    retry_setting retry;
    retry_policy policy{};
    int control_retry_attempts{1};
    std::chrono::milliseconds abort_timeout{5000ms};
    std::optional<mpu::encryption> encryption;
    /// Trust file for https endpoints; system trust when unset.
    std::optional<ss::sstring> ca_file;

    /// Throws std::invalid_argument on a missing endpoint and
    /// YAML::Exception on malformed values.
    static client_configuration from_yaml(const YAML::Node& root);
    static client_configuration load(std::string_view yaml_text);
    static ss::future<client_configuration> load_file(ss::sstring path);

    /// Upload settings with the retry switch resolved to an attempt count.
    /// Cancellation and progress reporting are left for the caller.
    multipart_config make_multipart_config() const;

    friend std::ostream& operator<<(std::ostream&, const client_configuration&);
};

} // namespace mpu

template<>
struct fmt::formatter<mpu::client_configuration> : fmt::ostream_formatter {};
