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

#include "upload/parts.h"

#include "base/vassert.h"

#include <algorithm>
#include <numeric>

namespace mpu {

std::vector<part> split_into_parts(uint64_t total_size, uint64_t part_size) {
    massert(part_size > 0, "part size must be positive");
    std::vector<part> parts;
    parts.reserve((total_size + part_size - 1) / part_size);
    for (uint64_t start = 0; start < total_size; start += part_size) {
        parts.push_back(part{
          .part_number = static_cast<int>(parts.size() + 1),
          .start = start,
          .end = std::min(start + part_size, total_size)});
    }
    return parts;
}

progress_tracker::progress_tracker(uint64_t total_size, size_t part_count)
  : _total_size(total_size)
  , _loaded(part_count, 0) {}

void progress_tracker::update(int part_number, uint64_t loaded) {
    massert(
      part_number >= 1 && static_cast<size_t>(part_number) <= _loaded.size(),
      "part {} outside of [1, {}]",
      part_number,
      _loaded.size());
    auto& slot = _loaded[part_number - 1];
    slot = std::max(slot, loaded);
}

uint64_t progress_tracker::loaded(int part_number) const {
    massert(
      part_number >= 1 && static_cast<size_t>(part_number) <= _loaded.size(),
      "part {} outside of [1, {}]",
      part_number,
      _loaded.size());
    return _loaded[part_number - 1];
}

double progress_tracker::fraction() const {
    if (_total_size == 0) {
        return 0.0;
    }
    auto sum = std::accumulate(_loaded.begin(), _loaded.end(), uint64_t{0});
    return std::clamp(
      static_cast<double>(sum) / static_cast<double>(_total_size), 0.0, 1.0);
}

} // namespace mpu
