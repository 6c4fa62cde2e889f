/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <optional>
#include <vector>
#include <seastar/core/future.hh>
#include <seastar/core/sstring.hh>

namespace kv {

using namespace seastar;

struct list_result {
    std::vector<sstring> keys;
    // Empty when the listing is exhausted.
    sstring cursor;
};

// String key/value store holding session metadata. Keys are listed in
// lexicographic order; the cursor is opaque to callers.
class metadata_store {
public:
    virtual ~metadata_store() = default;

    virtual future<std::optional<sstring>> get(sstring key) = 0;
    virtual future<> put(sstring key, sstring value) = 0;
    // Removing a missing key is not an error.
    virtual future<> remove(sstring key) = 0;
    virtual future<list_result> list(sstring prefix, sstring cursor, size_t limit) = 0;
};

} // namespace kv
