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
#include "http/client.h"
#include "upload/control_channel.h"
#include "utils/retry.h"

#include <seastar/core/sstring.hh>

namespace mpu {

struct control_endpoints {
    /// Base URL the paths below are appended to.
    ss::sstring endpoint;
    ss::sstring create_path{"/multipart/create"};
    ss::sstring presign_parts_path{"/multipart/presign-parts"};
    ss::sstring complete_path{"/multipart/complete"};
    ss::sstring abort_path{"/multipart/abort"};
    /// Attached to every call, e.g. authorization.
    header_map headers;
    /// Attempt budget of presign and complete calls. create and abort are
    /// never retried.
    int max_attempts{1};
    retry_policy retry{};
};

/// Control channel speaking JSON over HTTP POST.
class http_control_channel final : public control_channel {
public:
    http_control_channel(http::abstract_client& client, control_endpoints cfg);

    ss::future<session> create(
      const source_descriptor& source,
      const ss::sstring& metadata,
      const std::optional<encryption>& enc,
      ss::abort_source* as) final;

    ss::future<std::vector<presigned_part>> presign_parts(
      const session& s,
      const std::vector<int>& part_numbers,
      const std::optional<encryption>& enc,
      ss::abort_source* as) final;

    ss::future<ss::sstring> complete(
      const session& s,
      const std::vector<uploaded_part>& parts,
      ss::abort_source* as) final;

    ss::future<> abort(const session& s, ss::abort_source* as) final;

private:
    /// POSTs \p body and returns the body of a 2xx response. Other statuses
    /// raise server_error when the body is a structured error payload and a
    /// transport error otherwise.
    ss::future<ss::sstring> post(
      const ss::sstring& path,
      ss::sstring body,
      upload_stage stage,
      ss::abort_source* as);

    /// post() under the configured retry budget.
    ss::future<ss::sstring> post_with_retries(
      const ss::sstring& path,
      ss::sstring body,
      upload_stage stage,
      ss::abort_source* as);

    http::abstract_client& _client;
    control_endpoints _cfg;
};

} // namespace mpu
