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
#include "base/source_location.h"

#include <fmt/ostream.h>

template<>
struct fmt::formatter<mlog::file_line> : fmt::ostream_formatter {};

// NOLINTNEXTLINE
#define mlog_with_ctx(method, fmt, args...)                                    \
    method("{} - " fmt, mlog::file_line::current(), ##args)

// Logs through a seastar logger method, prefixed with the call site:
//   mlog(mpu_log.debug, "uploaded part {}", n);
// NOLINTNEXTLINE
#define mlog(method, fmt, args...) mlog_with_ctx(method, fmt, ##args)
