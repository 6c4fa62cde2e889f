/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include <stdexcept>
#include "kv/memory_metadata_store.hh"

namespace kv {

future<std::optional<sstring>> memory_metadata_store::get(sstring key) {
    auto it = _data.find(key);
    if (it == _data.end()) {
        return make_ready_future<std::optional<sstring>>(std::nullopt);
    }
    return make_ready_future<std::optional<sstring>>(it->second);
}

future<> memory_metadata_store::put(sstring key, sstring value) {
    _data.insert_or_assign(std::move(key), std::move(value));
    return make_ready_future<>();
}

future<> memory_metadata_store::remove(sstring key) {
    _data.erase(key);
    return make_ready_future<>();
}

future<list_result> memory_metadata_store::list(sstring prefix, sstring cursor, size_t limit) {
    if (limit == 0) {
        return make_exception_future<list_result>(std::invalid_argument("listing limit must be positive"));
    }
    // the cursor is the last key returned so far
    auto it = cursor.empty() ? _data.lower_bound(prefix) : _data.upper_bound(cursor);
    list_result ret;
    for (; it != _data.end() && it->first.starts_with(prefix); ++it) {
        if (ret.keys.size() == limit) {
            ret.cursor = ret.keys.back();
            break;
        }
        ret.keys.push_back(it->first);
    }
    return make_ready_future<list_result>(std::move(ret));
}

} // namespace kv
