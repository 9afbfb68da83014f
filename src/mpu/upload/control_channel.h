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

#include <seastar/core/abort_source.hh>
#include <seastar/core/future.hh>
#include <seastar/core/sstring.hh>

#include <optional>
#include <vector>

namespace mpu {

/// Request/response calls that drive an upload session on the storage
/// service. Implementations report failures as upload_error.
class control_channel {
public:
    control_channel() = default;
    control_channel(const control_channel&) = delete;
    control_channel& operator=(const control_channel&) = delete;
    control_channel(control_channel&&) = delete;
    control_channel& operator=(control_channel&&) = delete;
    virtual ~control_channel() = default;

    /// \brief Start a session
    ///
    /// \param source name, size and content type of the object
    /// \param metadata JSON text forwarded verbatim, empty for none
    /// \param enc requested server side encryption
    /// \param as cancellation
    virtual ss::future<session> create(
      const source_descriptor& source,
      const ss::sstring& metadata,
      const std::optional<encryption>& enc,
      ss::abort_source* as)
      = 0;

    /// Returns one presigned URL per requested part number. The answer is
    /// checked by the caller with validate_presigned_batch().
    virtual ss::future<std::vector<presigned_part>> presign_parts(
      const session& s,
      const std::vector<int>& part_numbers,
      const std::optional<encryption>& enc,
      ss::abort_source* as)
      = 0;

    /// \brief Assemble the object from its parts
    ///
    /// \param parts sorted ascending, contiguous from 1
    /// \return key of the stored object
    virtual ss::future<ss::sstring> complete(
      const session& s,
      const std::vector<uploaded_part>& parts,
      ss::abort_source* as)
      = 0;

    /// Discards the session and the parts stored so far.
    virtual ss::future<> abort(const session& s, ss::abort_source* as) = 0;
};

/// \brief Checks a presign answer against the batch that was requested
///
/// A part number outside of [1, part_count] fails with errc::invalid_parts;
/// a requested number that is missing or repeated, or a number that was not
/// requested, fails with errc::invalid_presign_response.
void validate_presigned_batch(
  const std::vector<int>& requested,
  const std::vector<presigned_part>& answer,
  size_t part_count);

} // namespace mpu
