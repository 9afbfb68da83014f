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

#include <seastar/core/abort_source.hh>
#include <seastar/core/coroutine.hh>
#include <seastar/core/future.hh>
#include <seastar/core/sleep.hh>
#include <seastar/util/noncopyable_function.hh>

#include <fmt/ostream.h>

#include <chrono>
#include <concepts>
#include <exception>
#include <iosfwd>
#include <type_traits>
#include <variant>

namespace mpu {

using namespace std::chrono_literals;

/// Inter-attempt backoff parameters. The delay before retry number n
/// (1-based) is min(max_delay, base_delay * backoff_multiplier^(n-1)) plus a
/// uniformly random jitter in [0, max_jitter].
struct retry_policy {
    std::chrono::milliseconds base_delay{1000ms};
    double backoff_multiplier{2.0};
    std::chrono::milliseconds max_delay{30000ms};
    std::chrono::milliseconds max_jitter{1000ms};

    static retry_policy defaults() { return {}; }

    bool operator==(const retry_policy&) const = default;
    friend std::ostream& operator<<(std::ostream&, const retry_policy&);
};

/// Attempt budget used when retries are switched on without a count.
constexpr int default_retry_attempts = 3;

/// Retry switch as callers spell it: unset, on/off, or an attempt count.
using retry_setting = std::variant<std::monostate, bool, int>;

/// Unset or false gives a single attempt, true gives
/// default_retry_attempts, and a count is clamped to at least one.
int resolve_max_attempts(const retry_setting&);

std::chrono::milliseconds compute_backoff(const retry_policy&, int attempt);

std::chrono::milliseconds jittered_backoff(const retry_policy&, int attempt);

/// True for the exceptions seastar raises when an abort_source fires
/// (abort_requested_exception, sleep_aborted).
bool is_cancellation(const std::exception_ptr&);

/// Called with the retry number and the chosen delay before each wait.
using backoff_observer
  = ss::noncopyable_function<void(int, std::chrono::milliseconds)>;

struct retry_hooks {
    /// Filters failures that may be retried. When unset every failure other
    /// than cancellation is retried.
    ss::noncopyable_function<bool(const std::exception_ptr&)> should_retry;
    backoff_observer on_backoff;
};

/// Attempt budget and backoff for one retried operation.
struct retry_options {
    int max_attempts{1};
    retry_policy policy{};
    backoff_observer on_backoff;
};

namespace detail {
void validate_max_attempts(int max_attempts);
void log_retry(
  int attempt,
  int max_attempts,
  std::chrono::milliseconds delay,
  const std::exception_ptr& err);
} // namespace detail

/// \brief Run \p func until it succeeds or the attempt budget runs out
///
/// Cancellation always wins: if \p as fires, the pending attempt or backoff
/// wait completes with the abort exception and no further attempt is made.
/// When attempts are exhausted the last failure is rethrown as is.
///
/// \param max_attempts total number of attempts, at least one
/// \param policy backoff parameters
/// \param func callable returning a future (or a plain value)
/// \param as optional cancellation source
/// \param hooks optional retry filter and backoff observer
template<typename Func>
requires std::invocable<Func&>
ss::futurize_t<std::invoke_result_t<Func&>> execute_with_retries(
  int max_attempts,
  retry_policy policy,
  Func func,
  ss::abort_source* as = nullptr,
  retry_hooks hooks = {}) {
    detail::validate_max_attempts(max_attempts);
    int attempt = 0;
    while (true) {
        if (as != nullptr) {
            as->check();
        }
        std::exception_ptr err;
        try {
            co_return co_await ss::futurize_invoke(func);
        } catch (...) {
            err = std::current_exception();
        }
        if (as != nullptr && as->abort_requested()) {
            // The failure may be a side effect of the abort (e.g. a torn
            // connection); report it as the cancellation it is.
            as->check();
        }
        if (is_cancellation(err)) {
            std::rethrow_exception(err);
        }
        ++attempt;
        if (
          attempt >= max_attempts
          || (hooks.should_retry && !hooks.should_retry(err))) {
            std::rethrow_exception(err);
        }
        auto delay = jittered_backoff(policy, attempt);
        detail::log_retry(attempt, max_attempts, delay, err);
        if (hooks.on_backoff) {
            hooks.on_backoff(attempt, delay);
        }
        if (as != nullptr) {
            co_await ss::sleep_abortable(delay, *as);
        } else {
            co_await ss::sleep(delay);
        }
    }
}

} // namespace mpu

template<>
struct fmt::formatter<mpu::retry_policy> : fmt::ostream_formatter {};
