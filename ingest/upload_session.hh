/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>
#include <fmt/format.h>
#include <seastar/core/sstring.hh>

namespace ingest {

using namespace seastar;
using clock_type = std::chrono::system_clock;

// ingesting -> sealed -> archiving -> done, failed from any non-terminal state
enum class session_state : uint8_t {
    ingesting,
    sealed,
    archiving,
    done,
    failed,
};

std::string_view to_string(session_state s) noexcept;
// Throws std::invalid_argument for an unknown name.
session_state session_state_from_string(std::string_view s);
bool is_terminal(session_state s) noexcept;
bool can_transition(session_state from, session_state to) noexcept;

struct source_file_target {
    sstring name;
    uint64_t declared_size = 0;
    sstring storage_key;
    sstring remote_multipart_id;
    uint64_t chunk_size = 0;
    unsigned total_chunks = 1;
    // the source multipart upload was completed remotely
    bool remote_completed = false;
};

struct upload_session {
    sstring id;
    sstring credential_hash;
    std::vector<source_file_target> source_files;
    session_state state = session_state::ingesting;
    clock_type::time_point created_at;
    std::optional<clock_type::time_point> sealed_at;
    std::optional<sstring> result_archive_id;
    std::optional<sstring> error;
    // source files already packed into the archive
    unsigned archived_files = 0;

    const source_file_target* find_file(std::string_view name) const noexcept;
    source_file_target* find_file(std::string_view name) noexcept;
    unsigned total_chunks() const noexcept;

    sstring to_json() const;
    // Throws rjson::error on malformed records.
    static upload_session from_json(std::string_view json);
};

struct chunk_record {
    sstring file_name;
    unsigned chunk_index = 0;
    unsigned part_number = 0;
    sstring remote_etag;
    clock_type::time_point confirmed_at;

    sstring to_json() const;
    static chunk_record from_json(std::string_view json);
};

// Catalog entry of a published archive.
struct archive_record {
    sstring archive_id;
    sstring file_name;
    sstring credential_hash;
    uint64_t size = 0;
    unsigned file_count = 0;
    clock_type::time_point created_at;
    clock_type::time_point expires_at;

    sstring to_json() const;
    static archive_record from_json(std::string_view json);
};

inline constexpr std::string_view archive_file_name = "files.zip";

// max(1, ceil(size / chunk_size)), not narrowed so that callers can range
// check declared sizes of any magnitude.
uint64_t total_chunks_for(uint64_t size, uint64_t chunk_size) noexcept;

// Rejects names that are not safe as archive entries: absolute paths, drive
// letters, ".." segments, backslashes and control characters.
void validate_entry_name(std::string_view name);

// Metadata keys.
sstring session_key(std::string_view session_id);
sstring counter_key(std::string_view session_id);
// "upload:{id}:chunk:" prefix of all the chunk records of the session
sstring chunk_prefix(std::string_view session_id);
// Percent-encodes '%' and ':' so that no file prefix covers another file.
sstring chunk_file_prefix(std::string_view session_id, std::string_view file_name);
sstring chunk_key(std::string_view session_id, std::string_view file_name, unsigned chunk_index);
sstring archive_key(std::string_view archive_id);

// Object keys.
sstring temp_object_key(std::string_view session_id, std::string_view file_name);
// "archives/{id}/{file_name}"
sstring archive_object_key(std::string_view archive_id, std::string_view file_name = archive_file_name);

} // namespace ingest

template <>
struct fmt::formatter<ingest::session_state> : fmt::formatter<std::string_view> {
    auto format(ingest::session_state s, fmt::format_context& ctx) const {
        return fmt::formatter<std::string_view>::format(ingest::to_string(s), ctx);
    }
};
