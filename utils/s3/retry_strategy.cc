/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include <algorithm>
#include <random>
#include <stdexcept>

#include "retry_strategy.hh"
#include "aws_error.hh"

using namespace std::chrono_literals;

namespace aws {

static std::chrono::milliseconds uniform_jitter(std::chrono::milliseconds window) {
    static thread_local std::default_random_engine engine{std::random_device{}()};
    if (window <= 0ms) {
        return 0ms;
    }
    std::uniform_int_distribution<int64_t> dist(0, window.count());
    return std::chrono::milliseconds(dist(engine));
}

default_retry_strategy::default_retry_strategy(retry_config cfg, jitter_source jitter)
    : _cfg(cfg)
    , _jitter(jitter ? std::move(jitter) : jitter_source(uniform_jitter)) {
    if (_cfg.max_attempts == 0) {
        throw std::invalid_argument("retry policy needs at least one attempt");
    }
}

retryable default_retry_strategy::should_retry(std::exception_ptr error, unsigned attempts_made) const {
    if (attempts_made >= _cfg.max_attempts) {
        return retryable::no;
    }

    return is_retryable(std::move(error));
}

std::chrono::milliseconds default_retry_strategy::delay_before_retry(unsigned attempts_made) const {
    if (attempts_made == 0) {
        return 0ms;
    }
    // Keep the shift bounded, the attempt count is configuration driven.
    auto exponent = std::min(attempts_made - 1, 20u);
    return _cfg.base_delay * (1UL << exponent) + _jitter(_cfg.jitter);
}

} // namespace aws
