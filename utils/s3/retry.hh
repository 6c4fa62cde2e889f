/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <chrono>
#include <concepts>
#include <type_traits>
#include <seastar/core/abort_source.hh>
#include <seastar/core/coroutine.hh>
#include <seastar/core/lowres_clock.hh>
#include <seastar/core/sleep.hh>
#include <seastar/core/timed_out_error.hh>
#include <seastar/core/timer.hh>
#include <seastar/coroutine/exception.hh>

#include "utils/log.hh"
#include "utils/observer.hh"
#include "utils/s3/retry_strategy.hh"

namespace s3 {

extern logging::logger retry_logger;

// Runs func until it succeeds, the error is not retryable, or the strategy
// runs out of attempts. The last error is rethrown as is, so callers can
// still classify it. Sleeping between attempts honors the abort source.
template <typename Func>
requires std::invocable<Func&>
std::invoke_result_t<Func&> with_retry(const aws::retry_strategy& strategy,
                                       utils::pipeline_observer& observer,
                                       seastar::sstring label,
                                       Func func,
                                       seastar::abort_source* as = nullptr) {
    // the http client does not check the abort status on entry
    if (as && as->abort_requested()) {
        co_await seastar::coroutine::return_exception_ptr(as->abort_requested_exception_ptr());
    }
    unsigned attempts = 0;
    while (true) {
        std::exception_ptr ex;
        try {
            ++attempts;
            co_return co_await func();
        } catch (...) {
            ex = std::current_exception();
        }

        if (!strategy.should_retry(ex, attempts)) {
            if (attempts > 1) {
                retry_logger.debug("{}: giving up after {} attempts: {}", label, attempts, ex);
            }
            co_await seastar::coroutine::return_exception_ptr(std::move(ex));
        }
        auto delay = strategy.delay_before_retry(attempts);
        retry_logger.warn("{}: attempt {} failed, retrying in {}ms: {}", label, attempts, delay.count(), ex);
        observer.on_retry(label, attempts, delay, ex);
        if (as) {
            co_await seastar::sleep_abortable(delay, *as);
        } else {
            co_await seastar::sleep(delay);
        }
    }
}

// Gives one call its own deadline. func receives an abort source that fires
// when the deadline passes or when the caller's source fires. Expiry is
// reported as seastar::timed_out_error, caller aborts as they are.
template <typename Func>
requires std::invocable<Func&, seastar::abort_source*>
std::invoke_result_t<Func&, seastar::abort_source*> with_deadline(std::chrono::milliseconds timeout, seastar::abort_source* outer, Func func) {
    if (outer) {
        outer->check();
    }
    seastar::abort_source as;
    bool expired = false;
    seastar::timer<seastar::lowres_clock> deadline([&as, &expired] {
        expired = true;
        if (!as.abort_requested()) {
            as.request_abort();
        }
    });
    seastar::optimized_optional<seastar::abort_source::subscription> sub;
    if (outer) {
        sub = outer->subscribe([&as] () noexcept {
            if (!as.abort_requested()) {
                as.request_abort();
            }
        });
    }
    deadline.arm(timeout);

    std::exception_ptr ex;
    try {
        co_return co_await func(&as);
    } catch (...) {
        ex = std::current_exception();
    }
    if (expired && !(outer && outer->abort_requested())) {
        co_await seastar::coroutine::return_exception_ptr(std::make_exception_ptr(seastar::timed_out_error()));
    }
    co_await seastar::coroutine::return_exception_ptr(std::move(ex));
}

} // namespace s3
