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

#include "upload/errors.h"

#include "utils/retry.h"

#include <seastar/core/print.hh>

#include <fmt/format.h>

namespace mpu {

upload_error::upload_error(
  errc code,
  ss::sstring message,
  std::optional<upload_stage> stage,
  std::optional<int> part_number)
  : _code(code)
  , _message(std::move(message))
  , _stage(stage)
  , _part_number(part_number) {
    format_what();
}

void upload_error::set_stage(upload_stage s) {
    if (!_stage) {
        _stage = s;
        format_what();
    }
}

void upload_error::set_part_number(int n) {
    if (!_part_number) {
        _part_number = n;
        format_what();
    }
}

void upload_error::set_http_status(int status) {
    if (!_http_status) {
        _http_status = status;
        format_what();
    }
}

bool upload_error::retryable() const noexcept {
    switch (_code) {
    case errc::transport_error:
        return true;
    case errc::server_error:
        return _http_status
               && (*_http_status == 429 || *_http_status >= 500);
    default:
        return false;
    }
}

void upload_error::format_what() {
    _what = fmt::format("{}: {}", make_error_code(_code).message(), _message);
    if (_stage) {
        _what += fmt::format(", stage: {}", *_stage);
    }
    if (_part_number) {
        _what += fmt::format(", part: {}", *_part_number);
    }
    if (_http_status) {
        _what += fmt::format(", http status: {}", *_http_status);
    }
}

server_error::server_error(
  payload p, int response_status, upload_stage stage)
  : upload_error(
      errc::server_error,
      p.code.empty() ? p.message : ss::format("{} ({})", p.message, p.code),
      stage)
  , _payload(std::move(p)) {
    set_http_status(_payload.http_status.value_or(response_status));
}

upload_error make_transport_error(
  ss::sstring message,
  upload_stage stage,
  std::optional<int> http_status,
  std::optional<int> part_number) {
    upload_error err(errc::transport_error, std::move(message), stage, part_number);
    if (http_status) {
        err.set_http_status(*http_status);
    }
    return err;
}

bool is_retryable(const std::exception_ptr& err) {
    if (is_cancellation(err)) {
        return false;
    }
    try {
        std::rethrow_exception(err);
    } catch (const upload_error& e) {
        return e.retryable();
    } catch (...) {
        return true;
    }
}

std::exception_ptr to_upload_error(
  std::exception_ptr err, upload_stage stage, std::optional<int> part_number) {
    if (is_cancellation(err)) {
        return std::make_exception_ptr(upload_error(
          errc::cancelled, "upload cancelled", stage, part_number));
    }
    try {
        std::rethrow_exception(err);
    } catch (upload_error& e) {
        e.set_stage(stage);
        if (part_number) {
            e.set_part_number(*part_number);
        }
        return err;
    } catch (const std::exception& e) {
        return std::make_exception_ptr(
          make_transport_error(e.what(), stage, std::nullopt, part_number));
    } catch (...) {
        return std::make_exception_ptr(make_transport_error(
          "unknown failure", stage, std::nullopt, part_number));
    }
}

} // namespace mpu
