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
#include "upload/types.h"
#include "utils/retry.h"

#include <seastar/core/abort_source.hh>
#include <seastar/core/future.hh>
#include <seastar/core/temporary_buffer.hh>

#include <optional>

namespace mpu {

struct part_upload_request {
    ss::sstring url;
    int part_number{0};
    ss::temporary_buffer<char> bytes;
    header_map headers;
    ss::abort_source* as{nullptr};
    /// Cumulative bytes sent for this part. Never decreases, also when an
    /// attempt is restarted.
    http::progress_callback on_progress;
};

/// \brief PUT one part to its presigned URL
///
/// Each attempt sends the whole part; non-2xx responses and connection
/// failures are retried within \p retry. A 2xx response without an ETag
/// fails the part immediately with errc::missing_etag. Failures are raised
/// as upload_error annotated with the part number.
ss::future<uploaded_part> upload_part(
  http::abstract_client& client,
  part_upload_request req,
  retry_options retry = {});

struct object_upload_request {
    ss::sstring url;
    ss::temporary_buffer<char> bytes;
    /// Sent as Content-Type unless \p headers already carries one.
    ss::sstring content_type{default_content_type};
    header_map headers;
    ss::abort_source* as{nullptr};
    http::progress_callback on_progress;
};

struct object_upload_result {
    int status{0};
    std::optional<ss::sstring> etag;
};

/// Single request upload of a whole object to a presigned URL.
ss::future<object_upload_result> upload_object(
  http::abstract_client& client,
  object_upload_request req,
  retry_options retry = {});

} // namespace mpu
