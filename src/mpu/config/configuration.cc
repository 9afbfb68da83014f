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

#include "config/configuration.h"

#include "config/convert.h"

#include <seastar/core/coroutine.hh>
#include <seastar/core/fstream.hh>
#include <seastar/core/seastar.hh>
#include <seastar/util/short_streams.hh>

#include <fmt/ostream.h>

#include <algorithm>
#include <ostream>
#include <stdexcept>

namespace mpu {

namespace {

template<typename T>
void read_optional(const YAML::Node& node, const char* name, T& out) {
    if (auto n = node[name]; n && !n.IsNull()) {
        out = n.as<T>();
    }
}

} // namespace

client_configuration client_configuration::from_yaml(const YAML::Node& root) {
    auto node = root["mpu"];
    if (!node || !node.IsMap()) {
        throw std::invalid_argument("configuration lacks an 'mpu' section");
    }
    client_configuration cfg;
    if (!node["endpoint"]) {
        throw std::invalid_argument("mpu.endpoint is required");
    }
    cfg.control.endpoint = node["endpoint"].as<ss::sstring>();
    read_optional(node, "create_path", cfg.control.create_path);
    read_optional(node, "presign_parts_path", cfg.control.presign_parts_path);
    read_optional(node, "complete_path", cfg.control.complete_path);
    read_optional(node, "abort_path", cfg.control.abort_path);
    if (auto headers = node["headers"]; headers && headers.IsMap()) {
        for (const auto& h : headers) {
            cfg.control.headers.emplace(
              h.first.as<ss::sstring>(), h.second.as<ss::sstring>());
        }
    }
    read_optional(node, "part_size", cfg.part_size);
    read_optional(node, "concurrency", cfg.concurrency);
    read_optional(node, "presign_batch_size", cfg.presign_batch_size);
    read_optional(node, "retry", cfg.retry);
    read_optional(node, "retry_policy", cfg.policy);
    read_optional(node, "control_retry_attempts", cfg.control_retry_attempts);
    read_optional(node, "abort_timeout_ms", cfg.abort_timeout);
    if (auto enc = node["encryption"]; enc && !enc.IsNull()) {
        cfg.encryption = enc.as<mpu::encryption>();
    }
    read_optional(node, "ca_file", cfg.ca_file);

    cfg.control.max_attempts = std::max(1, cfg.control_retry_attempts);
    cfg.control.retry = cfg.policy;
    return cfg;
}

client_configuration client_configuration::load(std::string_view yaml_text) {
    return from_yaml(YAML::Load(std::string(yaml_text)));
}

ss::future<client_configuration>
client_configuration::load_file(ss::sstring path) {
    auto f = co_await ss::open_file_dma(path, ss::open_flags::ro);
    auto in = ss::make_file_input_stream(std::move(f));
    std::exception_ptr err;
    ss::sstring text;
    try {
        text = co_await ss::util::read_entire_stream_contiguous(in);
    } catch (...) {
        err = std::current_exception();
    }
    co_await in.close();
    if (err) {
        std::rethrow_exception(err);
    }
    co_return load(text);
}

multipart_config client_configuration::make_multipart_config() const {
    multipart_config out;
    out.part_size = part_size;
    out.concurrency = concurrency;
    out.presign_batch_size = presign_batch_size;
    out.max_attempts = resolve_max_attempts(retry);
    out.retry = policy;
    out.abort_timeout = abort_timeout;
    out.encryption = encryption;
    return out;
}

std::ostream& operator<<(std::ostream& o, const client_configuration& c) {
    fmt::print(
      o,
      "{{endpoint: {}, headers: {} (redacted), part_size: {}, concurrency: {}, "
      "presign_batch_size: {}, max_attempts: {}, retry_policy: {}, "
      "control_retry_attempts: {}, abort_timeout: {}ms",
      c.control.endpoint,
      c.control.headers.size(),
      c.part_size,
      c.concurrency,
      c.presign_batch_size,
      resolve_max_attempts(c.retry),
      c.policy,
      c.control_retry_attempts,
      c.abort_timeout.count());
    if (c.encryption) {
        fmt::print(o, ", encryption: {}", *c.encryption);
    }
    o << "}";
    return o;
}

} // namespace mpu
