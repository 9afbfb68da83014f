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

#include <cstdint>
#include <string>
#include <system_error>

namespace mpu {

enum class errc : int16_t {
    success = 0,
    // Rejected before any network call
    invalid_part_size,
    invalid_concurrency,
    invalid_batch_size,
    invalid_metadata,
    empty_source,
    // Collaborator returned a malformed or inconsistent answer
    invalid_create_response,
    invalid_presign_response,
    invalid_parts,
    missing_etag,
    // Network failure or non-2xx status
    transport_error,
    // Structured error payload returned by the collaborator
    server_error,
    cancelled,
};

/// Broad failure classes used for retry and abort decisions.
enum class error_class {
    none,
    configuration,
    protocol,
    transport,
    server,
    cancellation,
};

constexpr error_class classify(errc e) noexcept {
    switch (e) {
    case errc::success:
        return error_class::none;
    case errc::invalid_part_size:
    case errc::invalid_concurrency:
    case errc::invalid_batch_size:
    case errc::invalid_metadata:
    case errc::empty_source:
        return error_class::configuration;
    case errc::invalid_create_response:
    case errc::invalid_presign_response:
    case errc::invalid_parts:
    case errc::missing_etag:
        return error_class::protocol;
    case errc::transport_error:
        return error_class::transport;
    case errc::server_error:
        return error_class::server;
    case errc::cancelled:
        return error_class::cancellation;
    }
    return error_class::none;
}

struct errc_category final : public std::error_category {
    const char* name() const noexcept final { return "mpu:errc"; }

    std::string message(int c) const final {
        switch (static_cast<errc>(c)) {
        case errc::success:
            return "success";
        case errc::invalid_part_size:
            return "invalid part size";
        case errc::invalid_concurrency:
            return "invalid concurrency";
        case errc::invalid_batch_size:
            return "invalid presign batch size";
        case errc::invalid_metadata:
            return "metadata is not valid JSON";
        case errc::empty_source:
            return "upload source is empty";
        case errc::invalid_create_response:
            return "invalid create response";
        case errc::invalid_presign_response:
            return "invalid presign response";
        case errc::invalid_parts:
            return "invalid parts";
        case errc::missing_etag:
            return "part accepted without an ETag";
        case errc::transport_error:
            return "transport error";
        case errc::server_error:
            return "server error";
        case errc::cancelled:
            return "cancelled";
        }
        return "mpu::errc::unknown";
    }
};

inline const std::error_category& error_category() noexcept {
    static errc_category e;
    return e;
}

inline std::error_code make_error_code(errc e) noexcept {
    return {static_cast<int>(e), error_category()};
}

} // namespace mpu

namespace std {
template<>
struct is_error_code_enum<mpu::errc> : true_type {};
} // namespace std
