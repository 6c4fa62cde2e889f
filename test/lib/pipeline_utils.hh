/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <chrono>
#include <string>
#include <utility>
#include <vector>

#include "utils/observer.hh"
#include "utils/s3/retry_strategy.hh"

namespace tests {

class counting_observer : public utils::pipeline_observer {
public:
    unsigned retries = 0;
    unsigned chunks_confirmed = 0;
    unsigned chunks_replayed = 0;
    unsigned parts_uploaded = 0;
    uint64_t part_bytes = 0;
    std::vector<std::pair<std::string, std::string>> transitions;

    void on_retry(std::string_view, unsigned, std::chrono::milliseconds, std::exception_ptr) override {
        ++retries;
    }
    void on_chunk_confirmed(std::string_view, bool is_new) override {
        ++(is_new ? chunks_confirmed : chunks_replayed);
    }
    void on_part_uploaded(std::string_view, unsigned, uint64_t bytes) override {
        ++parts_uploaded;
        part_bytes += bytes;
    }
    void on_state_change(std::string_view, std::string_view from, std::string_view to) override {
        transitions.emplace_back(from, to);
    }
};

// Same policy shape as production, without the waiting.
inline aws::retry_config fast_retry(unsigned max_attempts = 5) {
    return aws::retry_config{
        .max_attempts = max_attempts,
        .base_delay = std::chrono::milliseconds(1),
        .jitter = std::chrono::milliseconds(0),
    };
}

// Deterministic, non-repeating within 251 bytes.
inline std::string make_payload(size_t size, unsigned seed) {
    std::string ret(size, '\0');
    for (size_t i = 0; i < size; ++i) {
        ret[i] = char((i * 31 + seed * 7 + i / 251) % 251);
    }
    return ret;
}

} // namespace tests
