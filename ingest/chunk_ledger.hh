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

#include "ingest/session_locks.hh"
#include "ingest/upload_session.hh"
#include "kv/metadata_store.hh"
#include "utils/observer.hh"

namespace ingest {

struct ledger_config {
    size_t list_page_size = 1000;
    size_t fetch_concurrency = 64;
};

struct confirm_result {
    bool is_new;
    uint64_t uploaded_count;
};

// Idempotent record of confirmed chunks. A chunk is confirmed once per
// (session, file, index); replaying the same ETag is harmless, a different
// ETag is a remote_inconsistency_error. Writes of one session are serialized.
class chunk_ledger {
    kv::metadata_store& _store;
    ledger_config _cfg;
    session_locks _locks;

    future<std::vector<sstring>> list_keys(sstring prefix);
    future<uint64_t> read_counter(const sstring& session_id);
public:
    explicit chunk_ledger(kv::metadata_store& store, ledger_config cfg = {});

    future<confirm_result> confirm(sstring session_id, sstring file_name, unsigned chunk_index, unsigned part_number, sstring etag);
    future<std::optional<chunk_record>> find(sstring session_id, sstring file_name, unsigned chunk_index);
    // Sorted by part number.
    future<std::vector<chunk_record>> list_confirmed(sstring session_id, sstring file_name);
    future<uint64_t> uploaded_count(sstring session_id);
    // Rebuilds the counter from the records, e.g. after a crash between the
    // record and the counter write.
    future<uint64_t> recount(sstring session_id);
    future<> remove_session(sstring session_id);
};

} // namespace ingest
