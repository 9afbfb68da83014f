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

#include "base/vassert.h"

#include <seastar/util/backtrace.hh>
#include <seastar/util/log.hh>

#include <cstdlib>

namespace mpu::detail {

static seastar::logger assert_log("assert");

void massert_hook(std::string msg) {
    assert_log.error("{}\n{}", msg, seastar::current_backtrace());
    std::abort();
}

} // namespace mpu::detail
