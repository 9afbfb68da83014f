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
#include <cstddef>

namespace mpu {

// Binary size units, used for part sizes and I/O chunking.
constexpr size_t KiB = 1024;
constexpr size_t MiB = 1024 * KiB;

// NOLINTBEGIN(google-runtime-int)
constexpr size_t operator""_KiB(unsigned long long val) { return val * KiB; }
constexpr size_t operator""_MiB(unsigned long long val) { return val * MiB; }
// NOLINTEND(google-runtime-int)

} // namespace mpu
