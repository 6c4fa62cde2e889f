/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include <algorithm>
#include <stdexcept>
#include <utility>
#include <seastar/core/format.hh>

#include "ingest/exceptions.hh"
#include "ingest/upload_session.hh"
#include "utils/rjson.hh"

namespace ingest {

std::string_view to_string(session_state s) noexcept {
    switch (s) {
    case session_state::ingesting: return "ingesting";
    case session_state::sealed: return "sealed";
    case session_state::archiving: return "archiving";
    case session_state::done: return "done";
    case session_state::failed: return "failed";
    }
    return "unknown";
}

session_state session_state_from_string(std::string_view s) {
    for (auto st : {session_state::ingesting, session_state::sealed, session_state::archiving, session_state::done, session_state::failed}) {
        if (to_string(st) == s) {
            return st;
        }
    }
    throw std::invalid_argument(fmt::format("unknown session state '{}'", s));
}

bool is_terminal(session_state s) noexcept {
    return s == session_state::done || s == session_state::failed;
}

bool can_transition(session_state from, session_state to) noexcept {
    if (to == session_state::failed) {
        return !is_terminal(from);
    }
    switch (from) {
    case session_state::ingesting: return to == session_state::sealed;
    case session_state::sealed: return to == session_state::archiving;
    case session_state::archiving: return to == session_state::done;
    default: return false;
    }
}

static int64_t to_millis(clock_type::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

static clock_type::time_point from_millis(int64_t ms) {
    return clock_type::time_point(std::chrono::duration_cast<clock_type::duration>(std::chrono::milliseconds(ms)));
}

const source_file_target* upload_session::find_file(std::string_view name) const noexcept {
    for (const auto& f : source_files) {
        if (f.name == name) {
            return &f;
        }
    }
    return nullptr;
}

source_file_target* upload_session::find_file(std::string_view name) noexcept {
    return const_cast<source_file_target*>(std::as_const(*this).find_file(name));
}

unsigned upload_session::total_chunks() const noexcept {
    unsigned ret = 0;
    for (const auto& f : source_files) {
        ret += f.total_chunks;
    }
    return ret;
}

sstring upload_session::to_json() const {
    auto files = rjson::empty_array();
    for (const auto& f : source_files) {
        auto file = rjson::empty_object();
        rjson::add(file, "name", std::string_view(f.name));
        rjson::add(file, "declaredSize", rjson::value(f.declared_size));
        rjson::add(file, "storageKey", std::string_view(f.storage_key));
        rjson::add(file, "remoteMultipartId", std::string_view(f.remote_multipart_id));
        rjson::add(file, "chunkSize", rjson::value(f.chunk_size));
        rjson::add(file, "totalChunks", rjson::value(f.total_chunks));
        rjson::add(file, "remoteCompleted", rjson::value(f.remote_completed));
        rjson::push_back(files, std::move(file));
    }

    auto doc = rjson::empty_object();
    rjson::add(doc, "id", std::string_view(id));
    rjson::add(doc, "credentialHash", std::string_view(credential_hash));
    rjson::add(doc, "sourceFiles", std::move(files));
    rjson::add(doc, "state", to_string(state));
    rjson::add(doc, "createdAt", rjson::value(to_millis(created_at)));
    if (sealed_at) {
        rjson::add(doc, "sealedAt", rjson::value(to_millis(*sealed_at)));
    }
    if (result_archive_id) {
        rjson::add(doc, "resultArchiveId", std::string_view(*result_archive_id));
    }
    if (error) {
        rjson::add(doc, "error", std::string_view(*error));
    }
    rjson::add(doc, "archivedFiles", rjson::value(archived_files));
    return sstring(rjson::print(doc));
}

upload_session upload_session::from_json(std::string_view json) {
    auto doc = rjson::parse(json);
    upload_session s;
    s.id = rjson::get_string(doc, "id");
    s.credential_hash = rjson::get_string(doc, "credentialHash");
    const auto& files = rjson::get(doc, "sourceFiles");
    if (!files.IsArray()) {
        throw rjson::error("sourceFiles is not an array");
    }
    for (const auto& file : files.GetArray()) {
        source_file_target f;
        f.name = rjson::get_string(file, "name");
        f.declared_size = rjson::get_uint64(file, "declaredSize");
        f.storage_key = rjson::get_string(file, "storageKey");
        f.remote_multipart_id = rjson::get_string(file, "remoteMultipartId");
        f.chunk_size = rjson::get_uint64(file, "chunkSize");
        f.total_chunks = rjson::get_uint64(file, "totalChunks");
        f.remote_completed = rjson::get_bool(file, "remoteCompleted");
        s.source_files.push_back(std::move(f));
    }
    s.state = session_state_from_string(rjson::get_string(doc, "state"));
    s.created_at = from_millis(rjson::get_int64(doc, "createdAt"));
    if (rjson::find(doc, "sealedAt")) {
        s.sealed_at = from_millis(rjson::get_int64(doc, "sealedAt"));
    }
    s.result_archive_id = rjson::get_opt_string(doc, "resultArchiveId");
    s.error = rjson::get_opt_string(doc, "error");
    s.archived_files = rjson::get_uint64(doc, "archivedFiles");
    return s;
}

sstring chunk_record::to_json() const {
    auto doc = rjson::empty_object();
    rjson::add(doc, "fileName", std::string_view(file_name));
    rjson::add(doc, "chunkIndex", rjson::value(chunk_index));
    rjson::add(doc, "partNumber", rjson::value(part_number));
    rjson::add(doc, "remoteETag", std::string_view(remote_etag));
    rjson::add(doc, "confirmedAt", rjson::value(to_millis(confirmed_at)));
    return sstring(rjson::print(doc));
}

chunk_record chunk_record::from_json(std::string_view json) {
    auto doc = rjson::parse(json);
    return chunk_record{
        .file_name = rjson::get_string(doc, "fileName"),
        .chunk_index = unsigned(rjson::get_uint64(doc, "chunkIndex")),
        .part_number = unsigned(rjson::get_uint64(doc, "partNumber")),
        .remote_etag = rjson::get_string(doc, "remoteETag"),
        .confirmed_at = from_millis(rjson::get_int64(doc, "confirmedAt")),
    };
}

sstring archive_record::to_json() const {
    auto doc = rjson::empty_object();
    rjson::add(doc, "archiveId", std::string_view(archive_id));
    rjson::add(doc, "fileName", std::string_view(file_name));
    rjson::add(doc, "credentialHash", std::string_view(credential_hash));
    rjson::add(doc, "size", rjson::value(size));
    rjson::add(doc, "fileCount", rjson::value(file_count));
    rjson::add(doc, "createdAt", rjson::value(to_millis(created_at)));
    rjson::add(doc, "expiresAt", rjson::value(to_millis(expires_at)));
    return sstring(rjson::print(doc));
}

archive_record archive_record::from_json(std::string_view json) {
    auto doc = rjson::parse(json);
    return archive_record{
        .archive_id = rjson::get_string(doc, "archiveId"),
        .file_name = rjson::get_string(doc, "fileName"),
        .credential_hash = rjson::get_string(doc, "credentialHash"),
        .size = rjson::get_uint64(doc, "size"),
        .file_count = unsigned(rjson::get_uint64(doc, "fileCount")),
        .created_at = from_millis(rjson::get_int64(doc, "createdAt")),
        .expires_at = from_millis(rjson::get_int64(doc, "expiresAt")),
    };
}

uint64_t total_chunks_for(uint64_t size, uint64_t chunk_size) noexcept {
    if (size == 0 || chunk_size == 0) {
        return 1;
    }
    return size / chunk_size + (size % chunk_size != 0);
}

void validate_entry_name(std::string_view name) {
    if (name.empty()) {
        throw invalid_input_error("file names must not be empty");
    }
    bool drive_letter = name.size() > 1 && name[1] == ':' && ((name[0] >= 'a' && name[0] <= 'z') || (name[0] >= 'A' && name[0] <= 'Z'));
    if (name.front() == '/' || drive_letter) {
        throw invalid_input_error(fmt::format("file name {} is an absolute path", name));
    }
    for (unsigned char c : name) {
        if (c < 0x20 || c == 0x7f || c == '\\') {
            throw invalid_input_error(fmt::format("file name {} has a control character or a backslash", name));
        }
    }
    size_t start = 0;
    while (start <= name.size()) {
        auto end = name.find('/', start);
        if (end == std::string_view::npos) {
            end = name.size();
        }
        auto segment = name.substr(start, end - start);
        if (segment == "..") {
            throw invalid_input_error(fmt::format("file name {} leaves the archive root", name));
        }
        start = end + 1;
    }
}

static std::string escape_key_component(std::string_view name) {
    std::string ret;
    ret.reserve(name.size());
    for (char c : name) {
        switch (c) {
        case '%': ret += "%25"; break;
        case ':': ret += "%3A"; break;
        default: ret += c;
        }
    }
    return ret;
}

sstring session_key(std::string_view session_id) {
    return seastar::format("upload:{}", session_id);
}

sstring counter_key(std::string_view session_id) {
    return seastar::format("upload:{}:count", session_id);
}

sstring chunk_prefix(std::string_view session_id) {
    return seastar::format("upload:{}:chunk:", session_id);
}

sstring chunk_file_prefix(std::string_view session_id, std::string_view file_name) {
    return seastar::format("upload:{}:chunk:{}:", session_id, escape_key_component(file_name));
}

sstring chunk_key(std::string_view session_id, std::string_view file_name, unsigned chunk_index) {
    return seastar::format("{}{}", chunk_file_prefix(session_id, file_name), chunk_index);
}

sstring archive_key(std::string_view archive_id) {
    return seastar::format("archive:{}", archive_id);
}

sstring temp_object_key(std::string_view session_id, std::string_view file_name) {
    return seastar::format("temp/{}/{}", session_id, file_name);
}

sstring archive_object_key(std::string_view archive_id, std::string_view file_name) {
    return seastar::format("archives/{}/{}", archive_id, file_name);
}

} // namespace ingest
