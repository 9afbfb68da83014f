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

#include "upload/control_channel.h"

#include "upload/errors.h"

#include <seastar/core/print.hh>

#include <absl/container/flat_hash_set.h>

namespace mpu {

void validate_presigned_batch(
  const std::vector<int>& requested,
  const std::vector<presigned_part>& answer,
  size_t part_count) {
    absl::flat_hash_set<int> pending(requested.begin(), requested.end());
    for (const auto& p : answer) {
        if (p.part_number < 1 || static_cast<size_t>(p.part_number) > part_count) {
            throw upload_error(
              errc::invalid_parts,
              ss::format(
                "presigned part {} has no byte range, the upload has {} parts",
                p.part_number,
                part_count),
              upload_stage::presigning,
              p.part_number);
        }
        if (!pending.erase(p.part_number)) {
            throw upload_error(
              errc::invalid_presign_response,
              ss::format(
                "part {} is repeated or was not requested", p.part_number),
              upload_stage::presigning,
              p.part_number);
        }
    }
    if (!pending.empty()) {
        throw upload_error(
          errc::invalid_presign_response,
          ss::format(
            "{} requested part(s) missing from presign response, e.g. {}",
            pending.size(),
            *pending.begin()),
          upload_stage::presigning);
    }
}

} // namespace mpu
