/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <vector>
#include <seastar/core/future.hh>
#include <seastar/core/gate.hh>
#include <seastar/core/sstring.hh>
#include <seastar/core/units.hh>

#include "archive/archive_builder.hh"
#include "ingest/chunk_ledger.hh"
#include "ingest/credentials.hh"
#include "ingest/session_locks.hh"
#include "ingest/upload_session.hh"
#include "kv/metadata_store.hh"
#include "utils/observer.hh"
#include "utils/s3/multipart_storage_client.hh"

namespace ingest {

struct ingest_config {
    // Every chunk but the last of a file has this size.
    uint64_t chunk_size = 5_MiB;
    std::chrono::hours archive_ttl{24 * 30};
    // Archive after seal returns; seal waits for the archive otherwise.
    bool background_archiving = true;
    ledger_config ledger;
};

void validate(const ingest_config& cfg);

struct file_request {
    sstring name;
    uint64_t size = 0;
};

struct part_descriptor {
    unsigned part_number;
    sstring url;
    std::map<sstring, sstring> headers;
};

struct file_descriptor {
    sstring name;
    unsigned total_chunks;
    sstring multipart_id;
    std::vector<part_descriptor> parts;
};

struct session_descriptor {
    sstring session_id;
    uint64_t chunk_size;
    std::vector<file_descriptor> files;
};

struct confirm_response {
    uint64_t uploaded_count;
    unsigned total_chunks;
    bool is_new;
    double progress;
};

struct seal_response {
    session_state status;
    std::optional<sstring> archive_id;
};

struct session_status {
    session_state state;
    double progress = 0;
    std::optional<sstring> archive_id;
    std::optional<sstring> error;
};

// Drives an upload session from init to the published archive:
//
//   ingesting -> sealed -> archiving -> done
//
// with failed reachable from any non-terminal state. Chunks are uploaded by
// the clients straight to the storage with pre-authorized part requests and
// only confirmed here. Sealing checks the ledger for gaps, completes the
// source multipart uploads and hands the session to the archive builder.
//
// Session records are only written under the session lock, except by the
// archive run which owns the session while it is archiving.
class upload_session_manager {
    s3::multipart_storage_client& _storage;
    kv::metadata_store& _metadata;
    archive::archive_builder& _builder;
    const credential_verifier& _verifier;
    ingest_config _cfg;
    utils::pipeline_observer& _observer;
    chunk_ledger _ledger;
    session_locks _locks;
    gate _background;

    future<std::optional<upload_session>> find_session(sstring session_id);
    future<upload_session> load_session(sstring session_id);
    future<> save_session(const upload_session& s);
    future<> transition(upload_session& s, session_state to);
    future<> mark_failed(upload_session& s, sstring reason);
    future<> abort_uploads(const std::vector<source_file_target>& files) noexcept;
    future<seal_response> run_archive(sstring session_id);
    future<uint64_t> publish(upload_session& s, const sstring& archive_object);
public:
    upload_session_manager(s3::multipart_storage_client& storage, kv::metadata_store& metadata,
            archive::archive_builder& builder, const credential_verifier& verifier,
            ingest_config cfg = {}, utils::pipeline_observer& observer = utils::noop_observer());

    const ingest_config& config() const noexcept { return _cfg; }
    chunk_ledger& ledger() noexcept { return _ledger; }

    future<session_descriptor> init(std::vector<file_request> files, sstring credential);
    future<confirm_response> confirm_chunk(sstring session_id, sstring file_name, unsigned chunk_index, unsigned part_number, sstring etag);
    // Idempotent: a sealed session reports its current state.
    future<seal_response> seal(sstring session_id);
    future<session_status> status(sstring session_id);
    // Drops an abandoned session and its storage leftovers. Archiving
    // sessions are refused.
    future<> discard(sstring session_id);

    // Waits for the background archives.
    future<> stop();
};

} // namespace ingest
