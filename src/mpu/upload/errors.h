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
#include "upload/errc.h"
#include "upload/types.h"

#include <seastar/core/sstring.hh>

#include <exception>
#include <optional>
#include <string>

namespace mpu {

/// Terminal error of an upload operation. Carries the stage the failure
/// happened in and, for part uploads, the part number.
class upload_error : public std::exception {
public:
    upload_error(
      errc code,
      ss::sstring message,
      std::optional<upload_stage> stage = std::nullopt,
      std::optional<int> part_number = std::nullopt);

    const char* what() const noexcept final { return _what.c_str(); }

    errc code() const noexcept { return _code; }
    std::error_code error_code() const noexcept { return make_error_code(_code); }
    mpu::error_class kind() const noexcept { return classify(_code); }
    const ss::sstring& message() const noexcept { return _message; }

    std::optional<upload_stage> stage() const noexcept { return _stage; }
    std::optional<int> part_number() const noexcept { return _part_number; }
    std::optional<int> http_status() const noexcept { return _http_status; }

    /// Annotations added while the error travels outwards. An already known
    /// value is kept.
    void set_stage(upload_stage s);
    void set_part_number(int n);
    void set_http_status(int status);

    /// Transport errors are retryable, as are server errors reporting
    /// throttling (429) or a server side fault (5xx).
    bool retryable() const noexcept;

private:
    void format_what();

    errc _code;
    ss::sstring _message;
    std::optional<upload_stage> _stage;
    std::optional<int> _part_number;
    std::optional<int> _http_status;
    std::string _what;
};

/// Structured error payload returned by the control endpoints, preserved
/// as sent.
class server_error final : public upload_error {
public:
    struct payload {
        ss::sstring origin;
        ss::sstring code;
        ss::sstring message;
        /// Raw JSON text of the details member, empty when absent.
        ss::sstring details;
        std::optional<ss::sstring> recovery_suggestion;
        std::optional<int> http_status;
    };

    server_error(payload p, int response_status, upload_stage stage);

    const payload& server_payload() const noexcept { return _payload; }
    const ss::sstring& server_code() const noexcept { return _payload.code; }

private:
    payload _payload;
};

/// Network failure or unexpected status code.
upload_error make_transport_error(
  ss::sstring message,
  upload_stage stage,
  std::optional<int> http_status = std::nullopt,
  std::optional<int> part_number = std::nullopt);

/// Failures eligible for another attempt. Cancellation never is, an
/// upload_error decides for itself, anything else is treated as a
/// connection level failure and retried.
bool is_retryable(const std::exception_ptr&);

/// Translates \p err into the error raised to the caller: cancellation
/// becomes errc::cancelled, upload errors gain the stage and part number
/// they escaped from, other exceptions become transport errors.
std::exception_ptr to_upload_error(
  std::exception_ptr err,
  upload_stage stage,
  std::optional<int> part_number = std::nullopt);

} // namespace mpu
