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

#include <fmt/format.h>

#include <string>

namespace mpu::detail {
[[noreturn]] void massert_hook(std::string msg);
}

/** Checks an internal invariant of the library. Unlike input validation,
 * which throws, a failed invariant means the process state can no longer be
 * trusted: the message is logged and the process aborts.
 *
 * massert(idx < parts.size(), "part index {} out of range", idx);
 */
// NOLINTNEXTLINE(cppcoreguidelines-macro-usage)
#define massert(x, msg, args...)                                               \
    /* NOLINTNEXTLINE(cppcoreguidelines-avoid-do-while) */                     \
    do {                                                                       \
        if (!(x)) [[unlikely]] {                                               \
            ::mpu::detail::massert_hook(fmt::format(                           \
              "Assert failure: ({}:{}) '{}' " msg,                             \
              __FILE__,                                                        \
              __LINE__,                                                        \
              #x,                                                              \
              ##args));                                                        \
        }                                                                      \
    } while (0)
