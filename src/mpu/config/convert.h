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
#include "upload/types.h"
#include "utils/retry.h"

#include <seastar/core/sstring.hh>

#include <fmt/format.h>
#include <yaml-cpp/yaml.h>

#include <chrono>
#include <optional>
#include <string>

namespace YAML {

template<>
struct convert<ss::sstring> {
    static Node encode(const ss::sstring& rhs) { return Node(rhs.c_str()); }
    static bool decode(const Node& node, ss::sstring& rhs) {
        if (!node.IsScalar()) {
            return false;
        }
        rhs = node.as<std::string>();
        return true;
    }
};

template<typename T>
struct convert<std::optional<T>> {
    using type = std::optional<T>;

    static Node encode(const type& rhs) {
        if (rhs) {
            return Node(*rhs);
        }
        return Node(NodeType::Null);
    }

    static bool decode(const Node& node, type& rhs) {
        if (node && !node.IsNull()) {
            rhs = std::make_optional<T>(node.as<T>());
        } else {
            rhs = std::nullopt;
        }
        return true;
    }
};

template<>
struct convert<std::chrono::milliseconds> {
    using type = std::chrono::milliseconds;

    static Node encode(const type& rhs) { return Node(rhs.count()); }

    static bool decode(const Node& node, type& rhs) {
        type::rep ms;
        if (!convert<type::rep>::decode(node, ms)) {
            return false;
        }
        rhs = type(ms);
        return true;
    }
};

/// retry: true, false or an attempt count.
template<>
struct convert<mpu::retry_setting> {
    using type = mpu::retry_setting;

    static Node encode(const type& rhs) {
        if (const auto* b = std::get_if<bool>(&rhs)) {
            return Node(*b);
        }
        if (const auto* n = std::get_if<int>(&rhs)) {
            return Node(*n);
        }
        return Node(NodeType::Null);
    }

    static bool decode(const Node& node, type& rhs) {
        if (!node || node.IsNull()) {
            rhs = std::monostate{};
            return true;
        }
        if (!node.IsScalar()) {
            return false;
        }
        bool enabled{false};
        if (convert<bool>::decode(node, enabled)) {
            rhs = enabled;
            return true;
        }
        int attempts{0};
        if (convert<int>::decode(node, attempts)) {
            rhs = attempts;
            return true;
        }
        return false;
    }
};

template<>
struct convert<mpu::retry_policy> {
    using type = mpu::retry_policy;

    static Node encode(const type& rhs) {
        Node node;
        node["base_delay_ms"] = rhs.base_delay.count();
        node["backoff_multiplier"] = rhs.backoff_multiplier;
        node["max_delay_ms"] = rhs.max_delay.count();
        node["max_jitter_ms"] = rhs.max_jitter.count();
        return node;
    }

    static bool decode(const Node& node, type& rhs) {
        if (!node.IsMap()) {
            return false;
        }
        auto defaults = type::defaults();
        rhs.base_delay = node["base_delay_ms"].as<std::chrono::milliseconds>(
          defaults.base_delay);
        rhs.backoff_multiplier = node["backoff_multiplier"].as<double>(
          defaults.backoff_multiplier);
        rhs.max_delay = node["max_delay_ms"].as<std::chrono::milliseconds>(
          defaults.max_delay);
        rhs.max_jitter = node["max_jitter_ms"].as<std::chrono::milliseconds>(
          defaults.max_jitter);
        return true;
    }
};

/// type is one of SSE-S3, SSE-KMS (optional key_id) or SSE-C (customer_key,
/// optional customer_key_md5 and algorithm).
template<>
struct convert<mpu::encryption> {
    using type = mpu::encryption;

    static Node encode(const type& rhs) {
        Node node;
        node["type"] = fmt::format("{}", rhs.type);
        if (rhs.key_id) {
            node["key_id"] = rhs.key_id->c_str();
        }
        if (rhs.type == type::kind::sse_c) {
            node["algorithm"] = rhs.algorithm.c_str();
        }
        return node;
    }

    static bool decode(const Node& node, type& rhs) {
        if (!node.IsMap() || !node["type"]) {
            return false;
        }
        auto kind = node["type"].as<std::string>();
        if (kind == "SSE-S3") {
            rhs = type::sse_s3();
        } else if (kind == "SSE-KMS") {
            rhs = type::sse_kms(
              node["key_id"].as<std::optional<ss::sstring>>(std::nullopt));
        } else if (kind == "SSE-C") {
            if (!node["customer_key"]) {
                return false;
            }
            rhs = type::sse_c(
              node["customer_key"].as<ss::sstring>(),
              node["customer_key_md5"].as<std::optional<ss::sstring>>(
                std::nullopt),
              node["algorithm"].as<ss::sstring>("AES256"));
        } else {
            return false;
        }
        return true;
    }
};

} // namespace YAML
