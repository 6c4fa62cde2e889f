/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <map>
#include "kv/metadata_store.hh"

namespace kv {

// Shard-local store backed by an ordered map. Nothing survives a restart.
class memory_metadata_store final : public metadata_store {
    std::map<sstring, sstring> _data;
public:
    future<std::optional<sstring>> get(sstring key) override;
    future<> put(sstring key, sstring value) override;
    future<> remove(sstring key) override;
    future<list_result> list(sstring prefix, sstring cursor, size_t limit) override;

    size_t size() const noexcept { return _data.size(); }
};

} // namespace kv
