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

#include "utils/retry.h"

#include "base/vlog.h"
#include "utils/logger.h"

#include <seastar/core/sleep.hh>

#include <absl/random/distributions.h>
#include <absl/random/internal/pcg_engine.h>
#include <absl/random/seed_sequences.h>
#include <fmt/chrono.h>
#include <fmt/ostream.h>

#include <algorithm>
#include <cmath>
#include <ostream>
#include <stdexcept>

namespace mpu {

namespace {

absl::random_internal::pcg32_2018_engine& jitter_source() {
    thread_local static absl::random_internal::pcg32_2018_engine rng(
      absl::MakeSeedSeq());
    return rng;
}

} // namespace

std::ostream& operator<<(std::ostream& o, const retry_policy& p) {
    fmt::print(
      o,
      "{{base_delay: {}, backoff_multiplier: {}, max_delay: {}, max_jitter: "
      "{}}}",
      p.base_delay,
      p.backoff_multiplier,
      p.max_delay,
      p.max_jitter);
    return o;
}

int resolve_max_attempts(const retry_setting& setting) {
    if (const auto* enabled = std::get_if<bool>(&setting)) {
        return *enabled ? default_retry_attempts : 1;
    }
    if (const auto* count = std::get_if<int>(&setting)) {
        return std::max(1, *count);
    }
    return 1;
}

std::chrono::milliseconds
compute_backoff(const retry_policy& policy, int attempt) {
    auto exponent = std::max(0, attempt - 1);
    auto delay = static_cast<double>(policy.base_delay.count())
                 * std::pow(policy.backoff_multiplier, exponent);
    auto capped = std::min(delay, static_cast<double>(policy.max_delay.count()));
    return std::chrono::milliseconds(
      static_cast<std::chrono::milliseconds::rep>(std::max(0.0, capped)));
}

std::chrono::milliseconds
jittered_backoff(const retry_policy& policy, int attempt) {
    auto delay = compute_backoff(policy, attempt);
    if (policy.max_jitter <= 0ms) {
        return delay;
    }
    auto jitter = absl::Uniform<std::chrono::milliseconds::rep>(
      absl::IntervalClosedClosed,
      jitter_source(),
      0,
      policy.max_jitter.count());
    return delay + std::chrono::milliseconds(jitter);
}

bool is_cancellation(const std::exception_ptr& err) {
    if (!err) {
        return false;
    }
    try {
        std::rethrow_exception(err);
    } catch (const ss::abort_requested_exception&) {
        return true;
    } catch (const ss::sleep_aborted&) {
        return true;
    } catch (...) {
        return false;
    }
}

namespace detail {

void validate_max_attempts(int max_attempts) {
    if (max_attempts < 1) {
        throw std::invalid_argument(fmt::format(
          "max_attempts must be at least 1, got {}", max_attempts));
    }
}

void log_retry(
  int attempt,
  int max_attempts,
  std::chrono::milliseconds delay,
  const std::exception_ptr& err) {
    mlog(
      retry_log.warn,
      "Attempt {}/{} failed: {}, retrying in {}",
      attempt,
      max_attempts,
      err,
      delay);
}

} // namespace detail

} // namespace mpu
