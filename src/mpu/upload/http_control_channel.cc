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

#include "upload/http_control_channel.h"

#include "base/vlog.h"
#include "http/url.h"
#include "upload/control_codec.h"
#include "upload/errors.h"
#include "upload/logger.h"

#include <seastar/core/coroutine.hh>
#include <seastar/core/print.hh>

namespace mpu {

http_control_channel::http_control_channel(
  http::abstract_client& client, control_endpoints cfg)
  : _client(client)
  , _cfg(std::move(cfg)) {}

ss::future<ss::sstring> http_control_channel::post(
  const ss::sstring& path,
  ss::sstring body,
  upload_stage stage,
  ss::abort_source* as) {
    http::request req;
    req.method = "POST";
    req.url = http::join_url(_cfg.endpoint, path);
    for (const auto& [name, value] : _cfg.headers) {
        req.set_header(name, value);
    }
    req.set_header("Content-Type", "application/json");
    req.body = ss::temporary_buffer<char>(body.data(), body.size());

    mlog(mpu_log.trace, "POST {} ({} bytes)", req.url, body.size());
    auto resp = co_await _client.send(std::move(req), as, {});
    if (resp.is_success()) {
        co_return std::move(resp.body);
    }
    if (auto payload = codec::decode_error_payload(resp.body)) {
        throw server_error(std::move(*payload), resp.status, stage);
    }
    throw make_transport_error(
      ss::format("POST {} returned HTTP {}: {}", path, resp.status, resp.body),
      stage,
      resp.status);
}

ss::future<ss::sstring> http_control_channel::post_with_retries(
  const ss::sstring& path,
  ss::sstring body,
  upload_stage stage,
  ss::abort_source* as) {
    return execute_with_retries(
      _cfg.max_attempts,
      _cfg.retry,
      [this, &path, body = std::move(body), stage, as] {
          return post(path, body, stage, as);
      },
      as,
      retry_hooks{
        .should_retry =
          [](const std::exception_ptr& e) { return is_retryable(e); }});
}

ss::future<session> http_control_channel::create(
  const source_descriptor& source,
  const ss::sstring& metadata,
  const std::optional<encryption>& enc,
  ss::abort_source* as) {
    auto body = co_await post(
      _cfg.create_path,
      codec::encode_create_request(source, metadata, enc),
      upload_stage::creating,
      as);
    co_return codec::decode_create_response(body);
}

ss::future<std::vector<presigned_part>> http_control_channel::presign_parts(
  const session& s,
  const std::vector<int>& part_numbers,
  const std::optional<encryption>& enc,
  ss::abort_source* as) {
    auto body = co_await post_with_retries(
      _cfg.presign_parts_path,
      codec::encode_presign_request(s, part_numbers, enc),
      upload_stage::presigning,
      as);
    co_return codec::decode_presign_response(body);
}

ss::future<ss::sstring> http_control_channel::complete(
  const session& s,
  const std::vector<uploaded_part>& parts,
  ss::abort_source* as) {
    auto body = co_await post_with_retries(
      _cfg.complete_path,
      codec::encode_complete_request(s, parts),
      upload_stage::completing,
      as);
    auto key = codec::decode_complete_response(body);
    if (!key) {
        mlog(
          mpu_log.debug,
          "Complete response for {} names no key, keeping the session key",
          s);
        co_return s.key;
    }
    co_return std::move(*key);
}

ss::future<> http_control_channel::abort(
  const session& s, ss::abort_source* as) {
    co_await post(
      _cfg.abort_path,
      codec::encode_abort_request(s),
      upload_stage::aborting,
      as);
}

} // namespace mpu
