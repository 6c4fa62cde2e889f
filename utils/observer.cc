/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include <seastar/core/metrics.hh>

#include "utils/observer.hh"

namespace utils {

pipeline_observer& noop_observer() noexcept {
    static thread_local pipeline_observer noop;
    return noop;
}

metrics_observer::metrics_observer() {
    namespace sm = seastar::metrics;
    _metrics.add_group("fastfile", {
        sm::make_counter("storage_retries", [this] { return _retries; },
                sm::description("Total number of retried remote storage calls")),
        sm::make_counter("chunks_confirmed", [this] { return _chunks_confirmed; },
                sm::description("Total number of newly confirmed chunks")),
        sm::make_counter("chunks_replayed", [this] { return _chunks_replayed; },
                sm::description("Total number of chunk confirmations that were replays")),
        sm::make_counter("archive_parts_uploaded", [this] { return _parts_uploaded; },
                sm::description("Total number of archive parts uploaded")),
        sm::make_counter("archive_bytes_uploaded", [this] { return _part_bytes; },
                sm::description("Total number of archive bytes uploaded")),
        sm::make_counter("sessions_done", [this] { return _sessions_done; },
                sm::description("Total number of sessions that produced an archive")),
        sm::make_counter("sessions_failed", [this] { return _sessions_failed; },
                sm::description("Total number of sessions that ended failed")),
    });
}

void metrics_observer::on_retry(std::string_view, unsigned, std::chrono::milliseconds, std::exception_ptr) {
    ++_retries;
}

void metrics_observer::on_chunk_confirmed(std::string_view, bool is_new) {
    if (is_new) {
        ++_chunks_confirmed;
    } else {
        ++_chunks_replayed;
    }
}

void metrics_observer::on_part_uploaded(std::string_view, unsigned, uint64_t bytes) {
    ++_parts_uploaded;
    _part_bytes += bytes;
}

void metrics_observer::on_state_change(std::string_view, std::string_view, std::string_view to) {
    if (to == "done") {
        ++_sessions_done;
    } else if (to == "failed") {
        ++_sessions_failed;
    }
}

} // namespace utils
