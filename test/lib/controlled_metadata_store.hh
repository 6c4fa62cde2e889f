/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <functional>
#include "kv/memory_metadata_store.hh"

namespace tests {

// In-memory store that gives up the reactor on every call, so that callers
// running concurrently interleave between their store accesses, and that
// fails the puts a predicate selects.
class controlled_metadata_store final : public kv::metadata_store {
public:
    using put_filter = std::function<bool(const sstring& key, const sstring& value)>;
private:
    kv::memory_metadata_store _data;
    put_filter _fail_put;
    unsigned _inflight = 0;
    unsigned _max_inflight = 0;
    unsigned _failed_puts = 0;

    future<> enter();
    void leave() noexcept { --_inflight; }
public:
    // Puts for which filter returns true throw std::runtime_error.
    void fail_puts(put_filter filter) { _fail_put = std::move(filter); }

    future<std::optional<sstring>> get(sstring key) override;
    future<> put(sstring key, sstring value) override;
    future<> remove(sstring key) override;
    future<kv::list_result> list(sstring prefix, sstring cursor, size_t limit) override;

    size_t size() const noexcept { return _data.size(); }
    // Most calls in progress at the same time.
    unsigned max_inflight() const noexcept { return _max_inflight; }
    unsigned failed_puts() const noexcept { return _failed_puts; }
};

} // namespace tests
