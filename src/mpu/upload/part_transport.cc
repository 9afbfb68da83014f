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

#include "upload/part_transport.h"

#include "base/vlog.h"
#include "upload/errors.h"
#include "upload/logger.h"

#include <seastar/core/coroutine.hh>
#include <seastar/core/print.hh>

#include <absl/strings/match.h>

#include <algorithm>

namespace mpu {

namespace {

http::request make_put(
  const ss::sstring& url,
  const ss::temporary_buffer<char>& bytes,
  const header_map& headers) {
    http::request put;
    put.method = "PUT";
    put.url = url;
    put.body = bytes.share();
    for (const auto& [name, value] : headers) {
        put.set_header(name, value);
    }
    return put;
}

bool has_header(const header_map& headers, std::string_view name) {
    return std::any_of(headers.begin(), headers.end(), [name](const auto& h) {
        return absl::EqualsIgnoreCase(std::string_view(h.first), name);
    });
}

retry_hooks make_hooks(retry_options& retry) {
    return retry_hooks{
      .should_retry = [](const std::exception_ptr& e) { return is_retryable(e); },
      .on_backoff = std::move(retry.on_backoff)};
}

} // namespace

ss::future<uploaded_part> upload_part(
  http::abstract_client& client,
  part_upload_request req,
  retry_options retry) {
    uint64_t reported = 0;
    int attempts = 0;
    auto attempt = [&]() -> ss::future<uploaded_part> {
        ++attempts;
        mlog(
          mpu_log.trace,
          "PUT part {} ({} bytes), attempt {}",
          req.part_number,
          req.bytes.size(),
          attempts);
        auto resp = co_await client.send(
          make_put(req.url, req.bytes, req.headers),
          req.as,
          [&reported, &req](size_t sent) {
              if (sent > reported) {
                  reported = sent;
                  if (req.on_progress) {
                      req.on_progress(sent);
                  }
              }
          });
        if (!resp.is_success()) {
            throw make_transport_error(
              ss::format(
                "part upload returned HTTP {}: {}", resp.status, resp.body),
              upload_stage::uploading,
              resp.status,
              req.part_number);
        }
        auto etag = resp.header("ETag");
        if (!etag || etag->empty()) {
            auto err = upload_error(
              errc::missing_etag,
              ss::format(
                "HTTP {} response for part {} carries no ETag",
                resp.status,
                req.part_number),
              upload_stage::uploading,
              req.part_number);
            err.set_http_status(resp.status);
            throw err;
        }
        co_return uploaded_part{
          .part_number = req.part_number, .etag = std::move(*etag)};
    };

    std::exception_ptr err;
    try {
        co_return co_await execute_with_retries(
          retry.max_attempts, retry.policy, attempt, req.as, make_hooks(retry));
    } catch (...) {
        err = std::current_exception();
    }
    mlog(
      mpu_log.debug,
      "Part {} failed after {} attempt(s): {}",
      req.part_number,
      attempts,
      err);
    std::rethrow_exception(
      to_upload_error(err, upload_stage::uploading, req.part_number));
}

ss::future<object_upload_result> upload_object(
  http::abstract_client& client,
  object_upload_request req,
  retry_options retry) {
    if (!has_header(req.headers, "Content-Type")) {
        req.headers.emplace("Content-Type", req.content_type);
    }
    uint64_t reported = 0;
    auto attempt = [&]() -> ss::future<object_upload_result> {
        auto resp = co_await client.send(
          make_put(req.url, req.bytes, req.headers),
          req.as,
          [&reported, &req](size_t sent) {
              if (sent > reported) {
                  reported = sent;
                  if (req.on_progress) {
                      req.on_progress(sent);
                  }
              }
          });
        if (!resp.is_success()) {
            throw make_transport_error(
              ss::format("upload returned HTTP {}: {}", resp.status, resp.body),
              upload_stage::uploading,
              resp.status);
        }
        co_return object_upload_result{
          .status = resp.status, .etag = resp.header("ETag")};
    };

    std::exception_ptr err;
    try {
        auto result = co_await execute_with_retries(
          retry.max_attempts, retry.policy, attempt, req.as, make_hooks(retry));
        mlog(
          mpu_log.info,
          "Uploaded {} bytes in a single request, HTTP {}",
          req.bytes.size(),
          result.status);
        co_return result;
    } catch (...) {
        err = std::current_exception();
    }
    std::rethrow_exception(to_upload_error(err, upload_stage::uploading));
}

} // namespace mpu
