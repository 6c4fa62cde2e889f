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
#include <string_view>
#include <seastar/core/metrics_registration.hh>

namespace utils {

// Observability hooks of the ingestion pipeline. Components get a reference
// at construction and call it unconditionally; the base implementation does
// nothing.
class pipeline_observer {
public:
    virtual ~pipeline_observer() = default;

    virtual void on_retry(std::string_view label, unsigned attempt, std::chrono::milliseconds delay, std::exception_ptr error) {}
    virtual void on_chunk_confirmed(std::string_view session_id, bool is_new) {}
    virtual void on_part_uploaded(std::string_view object_name, unsigned part_number, uint64_t bytes) {}
    virtual void on_state_change(std::string_view session_id, std::string_view from, std::string_view to) {}
};

pipeline_observer& noop_observer() noexcept;

// Exports the pipeline counters as seastar metrics of the "fastfile" group.
class metrics_observer final : public pipeline_observer {
    seastar::metrics::metric_groups _metrics;
    uint64_t _retries = 0;
    uint64_t _chunks_confirmed = 0;
    uint64_t _chunks_replayed = 0;
    uint64_t _parts_uploaded = 0;
    uint64_t _part_bytes = 0;
    uint64_t _sessions_done = 0;
    uint64_t _sessions_failed = 0;
public:
    metrics_observer();

    void on_retry(std::string_view label, unsigned attempt, std::chrono::milliseconds delay, std::exception_ptr error) override;
    void on_chunk_confirmed(std::string_view session_id, bool is_new) override;
    void on_part_uploaded(std::string_view object_name, unsigned part_number, uint64_t bytes) override;
    void on_state_change(std::string_view session_id, std::string_view from, std::string_view to) override;
};

} // namespace utils
