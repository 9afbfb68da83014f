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
#include "upload/parts.h"
#include "upload/source.h"
#include "upload/types.h"
#include "utils/prefix_logger.h"

#include <seastar/core/future.hh>
#include <seastar/core/sstring.hh>

#include <exception>
#include <optional>
#include <vector>

namespace mpu {

/// \brief One multipart upload session, from validation to complete/abort
///
/// The source is split into parts which are presigned in batches and then
/// uploaded by min(concurrency, parts) workers claiming parts in ascending
/// order. Any failure once the session exists ends in exactly one abort
/// call, after which the original failure is raised.
class multipart_upload {
public:
    multipart_upload(
      control_channel& control,
      http::abstract_client& transport,
      upload_source& source,
      ss::sstring metadata,
      multipart_config cfg);

    /// May be called once.
    ss::future<multipart_result> run();

    upload_stage stage() const { return _stage; }

private:
    void set_stage(upload_stage s);
    void validate() const;
    void check_cancelled() const;

    ss::future<> presign_all();
    ss::future<> upload_all();
    ss::future<> worker(size_t id);
    ss::future<ss::sstring> complete();
    /// Best effort, bounded by abort_timeout. Never throws.
    ss::future<> abort_session();

    void report_progress(int part_number, uint64_t loaded);

    control_channel& _control;
    http::abstract_client& _transport;
    upload_source& _source;
    ss::sstring _metadata;
    multipart_config _cfg;
    prefix_logger _log;

    upload_stage _stage{upload_stage::validating};
    session _session;
    std::vector<part> _parts;
    std::vector<presigned_part> _presigned;
    std::optional<progress_tracker> _progress;

    // Worker pool state. Workers run on one shard, so claiming a part is a
    // plain read-and-increment between suspension points.
    size_t _next_part{0};
    std::exception_ptr _first_failure;
    std::vector<uploaded_part> _uploaded;
};

/// \brief Upload \p source as a multipart object
///
/// \param control session control endpoints
/// \param transport client used for the part PUTs
/// \param source bytes to upload, must outlive the returned future
/// \param metadata JSON text forwarded to the create call, empty for none
/// \param cfg part size, concurrency, retry, cancellation and progress
/// \return key, upload id and part count of the stored object; failures
///   are raised as upload_error
ss::future<multipart_result> execute_multipart_upload(
  control_channel& control,
  http::abstract_client& transport,
  upload_source& source,
  ss::sstring metadata,
  multipart_config cfg);

} // namespace mpu
