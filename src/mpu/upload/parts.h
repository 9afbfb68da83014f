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

#include "upload/types.h"

#include <cstdint>
#include <vector>

namespace mpu {

/// Splits [0, total_size) into ceil(total_size / part_size) parts numbered
/// from 1. Every part but the last is exactly part_size bytes, the last one
/// holds the remainder. Both arguments must be positive.
std::vector<part> split_into_parts(uint64_t total_size, uint64_t part_size);

/// Bytes acknowledged per part, indexed by part_number - 1. Each slot is
/// written only by the worker uploading that part; the aggregate is an
/// advisory fold over the slots.
class progress_tracker {
public:
    progress_tracker(uint64_t total_size, size_t part_count);

    /// Records \p loaded bytes for \p part_number. Values never decrease, a
    /// restarted attempt does not move the slot backwards.
    void update(int part_number, uint64_t loaded);

    uint64_t loaded(int part_number) const;

    /// sum(loaded) / total_size, clamped to [0, 1].
    double fraction() const;

private:
    uint64_t _total_size;
    std::vector<uint64_t> _loaded;
};

} // namespace mpu
