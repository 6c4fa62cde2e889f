/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include <algorithm>
#include <stdexcept>
#include <seastar/core/coroutine.hh>
#include <seastar/core/later.hh>
#include <seastar/coroutine/exception.hh>
#include <seastar/util/defer.hh>

#include "test/lib/controlled_metadata_store.hh"

namespace tests {

future<> controlled_metadata_store::enter() {
    _max_inflight = std::max(_max_inflight, ++_inflight);
    return seastar::yield();
}

future<std::optional<sstring>> controlled_metadata_store::get(sstring key) {
    co_await enter();
    auto done = defer([this] () noexcept { leave(); });
    co_return co_await _data.get(std::move(key));
}

future<> controlled_metadata_store::put(sstring key, sstring value) {
    co_await enter();
    auto done = defer([this] () noexcept { leave(); });
    if (_fail_put && _fail_put(key, value)) {
        ++_failed_puts;
        co_await coroutine::return_exception(std::runtime_error(format("injected failure writing {}", key)));
    }
    co_await _data.put(std::move(key), std::move(value));
}

future<> controlled_metadata_store::remove(sstring key) {
    co_await enter();
    auto done = defer([this] () noexcept { leave(); });
    co_await _data.remove(std::move(key));
}

future<kv::list_result> controlled_metadata_store::list(sstring prefix, sstring cursor, size_t limit) {
    co_await enter();
    auto done = defer([this] () noexcept { leave(); });
    co_return co_await _data.list(std::move(prefix), std::move(cursor), limit);
}

} // namespace tests
