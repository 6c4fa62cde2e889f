/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once
#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>

#include "utils/http_client_error_processing.hh"

namespace aws {

using utils::http::retryable;

struct retry_config {
    // Total number of attempts, the first one included.
    unsigned max_attempts = 5;
    std::chrono::milliseconds base_delay{1000};
    std::chrono::milliseconds jitter{1000};
};

class retry_strategy {
public:
    virtual ~retry_strategy() = default;
    // Returns true if the error can be retried given the error and the number of attempts already made.
    [[nodiscard]] virtual retryable should_retry(std::exception_ptr error, unsigned attempts_made) const = 0;

    // Time to wait before attempt number attempts_made + 1.
    [[nodiscard]] virtual std::chrono::milliseconds delay_before_retry(unsigned attempts_made) const = 0;

    [[nodiscard]] virtual unsigned get_max_attempts() const = 0;
};

// Exponential backoff with uniform jitter: the delay after attempt k is
// base * 2^(k-1) + uniform(0, jitter).
class default_retry_strategy : public retry_strategy {
public:
    using jitter_source = std::function<std::chrono::milliseconds(std::chrono::milliseconds window)>;
private:
    retry_config _cfg;
    jitter_source _jitter;

public:
    explicit default_retry_strategy(retry_config cfg = {}, jitter_source jitter = {});

    [[nodiscard]] retryable should_retry(std::exception_ptr error, unsigned attempts_made) const override;

    [[nodiscard]] std::chrono::milliseconds delay_before_retry(unsigned attempts_made) const override;

    [[nodiscard]] unsigned get_max_attempts() const override { return _cfg.max_attempts; }
};

} // namespace aws
