/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <type_traits>
#include <unordered_map>
#include <seastar/core/coroutine.hh>
#include <seastar/core/semaphore.hh>
#include <seastar/core/shared_ptr.hh>
#include <seastar/core/sstring.hh>
#include <seastar/util/defer.hh>

namespace ingest {

// Mutual exclusion per session id. Entries are created on first use and
// dropped as soon as nobody holds or waits for them.
class session_locks {
    struct entry {
        seastar::semaphore sem{1};
        unsigned users = 0;
    };
    std::unordered_map<seastar::sstring, seastar::lw_shared_ptr<entry>> _locks;

public:
    template <typename Func>
    requires std::invocable<Func&>
    std::invoke_result_t<Func&> with_lock(seastar::sstring key, Func func) {
        auto it = _locks.find(key);
        if (it == _locks.end()) {
            it = _locks.emplace(key, seastar::make_lw_shared<entry>()).first;
        }
        auto e = it->second;
        ++e->users;
        auto release = seastar::defer([this, &key, e] () noexcept {
            if (--e->users == 0) {
                _locks.erase(key);
            }
        });
        auto units = co_await seastar::get_units(e->sem, 1);
        co_return co_await func();
    }

    size_t size() const noexcept { return _locks.size(); }
};

} // namespace ingest
