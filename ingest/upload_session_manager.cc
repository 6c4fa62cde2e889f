/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include <algorithm>
#include <unordered_set>
#include <boost/algorithm/string/predicate.hpp>
#include <seastar/core/coroutine.hh>
#include <seastar/core/on_internal_error.hh>
#include <seastar/coroutine/exception.hh>

#include "ingest/exceptions.hh"
#include "ingest/upload_session_manager.hh"
#include "utils/log.hh"

namespace ingest {

static logging::logger sessionl("session");

void validate(const ingest_config& cfg) {
    if (cfg.chunk_size < s3::aws_minimum_part_size || cfg.chunk_size > s3::aws_maximum_part_size) {
        throw std::invalid_argument(fmt::format("chunk size {} is outside of [{}, {}]", cfg.chunk_size, s3::aws_minimum_part_size, s3::aws_maximum_part_size));
    }
    if (cfg.archive_ttl.count() <= 0) {
        throw std::invalid_argument("archive TTL must be positive");
    }
}

static double fraction(uint64_t done, uint64_t total) noexcept {
    if (total == 0) {
        return 0;
    }
    return std::min(1.0, double(done) / double(total));
}

static bool is_passthrough(const upload_session& s) {
    return s.source_files.size() == 1 && boost::algorithm::iends_with(std::string_view(s.source_files.front().name), ".zip");
}

upload_session_manager::upload_session_manager(s3::multipart_storage_client& storage, kv::metadata_store& metadata,
        archive::archive_builder& builder, const credential_verifier& verifier,
        ingest_config cfg, utils::pipeline_observer& observer)
    : _storage(storage)
    , _metadata(metadata)
    , _builder(builder)
    , _verifier(verifier)
    , _cfg(std::move(cfg))
    , _observer(observer)
    , _ledger(metadata, _cfg.ledger)
{
    validate(_cfg);
}

future<std::optional<upload_session>> upload_session_manager::find_session(sstring session_id) {
    auto value = co_await _metadata.get(session_key(session_id));
    if (!value) {
        co_return std::nullopt;
    }
    co_return upload_session::from_json(*value);
}

future<upload_session> upload_session_manager::load_session(sstring session_id) {
    auto s = co_await find_session(session_id);
    if (!s) {
        co_await coroutine::return_exception(session_not_found(session_id));
    }
    co_return std::move(*s);
}

future<> upload_session_manager::save_session(const upload_session& s) {
    return _metadata.put(session_key(s.id), s.to_json());
}

future<> upload_session_manager::transition(upload_session& s, session_state to) {
    if (!can_transition(s.state, to)) {
        on_internal_error(sessionl, fmt::format("session {}: invalid transition {} -> {}", s.id, s.state, to));
    }
    auto next = s;
    next.state = to;
    co_await save_session(next);
    auto from = std::exchange(s, std::move(next)).state;
    sessionl.info("Session {}: {} -> {}", s.id, from, to);
    _observer.on_state_change(s.id, to_string(from), to_string(to));
}

future<> upload_session_manager::mark_failed(upload_session& s, sstring reason) {
    if (is_terminal(s.state)) {
        co_return;
    }
    s.error = std::move(reason);
    co_await transition(s, session_state::failed);
}

future<> upload_session_manager::abort_uploads(const std::vector<source_file_target>& files) noexcept {
    for (const auto& f : files) {
        if (!f.remote_completed) {
            co_await _storage.abort_multipart(f.storage_key, f.remote_multipart_id);
        }
    }
}

future<session_descriptor> upload_session_manager::init(std::vector<file_request> files, sstring credential) {
    if (!_verifier.is_valid(credential)) {
        throw invalid_input_error("invalid credential");
    }
    if (files.empty()) {
        throw invalid_input_error("a session needs at least one file");
    }
    std::unordered_set<sstring> names;
    for (const auto& f : files) {
        validate_entry_name(f.name);
        if (!names.insert(f.name).second) {
            throw invalid_input_error(fmt::format("duplicate file name {}", f.name));
        }
        if (total_chunks_for(f.size, _cfg.chunk_size) > uint64_t(s3::aws_maximum_parts_in_piece)) {
            throw invalid_input_error(fmt::format("{} ({} bytes) needs more than {} chunks of {} bytes",
                    f.name, f.size, s3::aws_maximum_parts_in_piece, _cfg.chunk_size));
        }
    }

    upload_session s;
    s.id = make_random_id();
    s.credential_hash = _verifier.hash(credential);
    s.created_at = clock_type::now();

    session_descriptor desc{
        .session_id = s.id,
        .chunk_size = _cfg.chunk_size,
    };

    std::exception_ptr ex;
    try {
        for (const auto& f : files) {
            source_file_target target{
                .name = f.name,
                .declared_size = f.size,
                .storage_key = temp_object_key(s.id, f.name),
                .chunk_size = _cfg.chunk_size,
                // range checked above
                .total_chunks = unsigned(total_chunks_for(f.size, _cfg.chunk_size)),
            };
            target.remote_multipart_id = co_await _storage.create_multipart(target.storage_key);
            s.source_files.push_back(target);

            file_descriptor fd{
                .name = target.name,
                .total_chunks = target.total_chunks,
                .multipart_id = target.remote_multipart_id,
            };
            for (unsigned part = 1; part <= target.total_chunks; ++part) {
                auto req = co_await _storage.authorize_part_upload(target.storage_key, target.remote_multipart_id, part);
                fd.parts.push_back(part_descriptor{part, std::move(req.url), std::move(req.headers)});
            }
            desc.files.push_back(std::move(fd));
        }
        co_await save_session(s);
    } catch (...) {
        ex = std::current_exception();
    }
    if (ex) {
        sessionl.warn("Failed to initialize session {}: {}", s.id, ex);
        co_await abort_uploads(s.source_files);
        std::rethrow_exception(ex);
    }

    sessionl.info("Session {} initialized: {} files, {} chunks", s.id, s.source_files.size(), s.total_chunks());
    co_return desc;
}

future<confirm_response> upload_session_manager::confirm_chunk(sstring session_id, sstring file_name, unsigned chunk_index, unsigned part_number, sstring etag) {
    return _locks.with_lock(session_id, [=, this] () -> future<confirm_response> {
        auto s = co_await load_session(session_id);
        auto* f = s.find_file(file_name);
        if (!f) {
            throw invalid_input_error(fmt::format("{} is not part of session {}", file_name, session_id));
        }
        if (chunk_index >= f->total_chunks) {
            throw invalid_input_error(fmt::format("chunk {} of {} is out of range, the file has {} chunks", chunk_index, file_name, f->total_chunks));
        }
        if (part_number != chunk_index + 1) {
            throw invalid_input_error(fmt::format("chunk {} must be uploaded as part {}, not {}", chunk_index, chunk_index + 1, part_number));
        }
        if (etag.empty()) {
            throw invalid_input_error("missing ETag");
        }

        auto total = s.total_chunks();
        if (s.state != session_state::ingesting) {
            // an exact replay is still answered after seal
            auto rec = co_await _ledger.find(session_id, file_name, chunk_index);
            if (!rec || rec->remote_etag != etag) {
                throw invalid_input_error(fmt::format("session {} is {}, no more chunks are accepted", session_id, s.state));
            }
            auto count = co_await _ledger.uploaded_count(session_id);
            _observer.on_chunk_confirmed(session_id, false);
            co_return confirm_response{
                .uploaded_count = count,
                .total_chunks = total,
                .is_new = false,
                .progress = fraction(count, total),
            };
        }

        std::exception_ptr ex;
        try {
            auto res = co_await _ledger.confirm(session_id, file_name, chunk_index, part_number, etag);
            _observer.on_chunk_confirmed(session_id, res.is_new);
            co_return confirm_response{
                .uploaded_count = res.uploaded_count,
                .total_chunks = total,
                .is_new = res.is_new,
                .progress = fraction(res.uploaded_count, total),
            };
        } catch (const remote_inconsistency_error&) {
            ex = std::current_exception();
        }
        sessionl.error("Session {}: {}", session_id, ex);
        co_await mark_failed(s, fmt::format("{}", ex));
        std::rethrow_exception(ex);
    });
}

future<seal_response> upload_session_manager::seal(sstring session_id) {
    auto gh = _background.hold();
    auto [resp, hand_off] = co_await _locks.with_lock(session_id, [this, session_id] () -> future<std::pair<seal_response, bool>> {
        auto s = co_await load_session(session_id);
        switch (s.state) {
        case session_state::failed:
            throw invalid_input_error(fmt::format("session {} failed: {}", session_id, s.error.value_or("unknown error")));
        case session_state::archiving:
        case session_state::done:
            co_return std::make_pair(seal_response{s.state, s.result_archive_id}, false);
        case session_state::sealed:
            // a previous seal stopped before the hand-off
            break;
        case session_state::ingesting: {
            missing_chunks missing;
            std::vector<std::vector<s3::completed_part>> parts(s.source_files.size());
            for (size_t i = 0; i < s.source_files.size(); ++i) {
                const auto& f = s.source_files[i];
                std::vector<bool> present(f.total_chunks, false);
                for (auto& rec : co_await _ledger.list_confirmed(session_id, f.name)) {
                    if (rec.chunk_index < f.total_chunks && !present[rec.chunk_index]) {
                        present[rec.chunk_index] = true;
                        parts[i].push_back(s3::completed_part{rec.part_number, std::move(rec.remote_etag)});
                    }
                }
                for (unsigned idx = 0; idx < f.total_chunks; ++idx) {
                    if (!present[idx]) {
                        missing[std::string(f.name)].push_back(idx);
                    }
                }
            }
            if (!missing.empty()) {
                sessionl.info("Session {} cannot be sealed, {} files have missing chunks", session_id, missing.size());
                co_await coroutine::return_exception(incomplete_upload_error(std::move(missing)));
            }

            for (size_t i = 0; i < s.source_files.size(); ++i) {
                auto& f = s.source_files[i];
                if (f.remote_completed) {
                    continue;
                }
                co_await _storage.complete_multipart(f.storage_key, f.remote_multipart_id, std::move(parts[i]));
                f.remote_completed = true;
                co_await save_session(s);
                sessionl.debug("Session {}: completed the upload of {}", session_id, f.name);
            }
            s.sealed_at = clock_type::now();
            co_await transition(s, session_state::sealed);
            break;
        }
        }
        co_await transition(s, session_state::archiving);
        co_return std::make_pair(seal_response{session_state::archiving, std::nullopt}, true);
    });

    if (!hand_off) {
        co_return resp;
    }
    if (!_cfg.background_archiving) {
        co_return co_await run_archive(session_id);
    }
    // the outcome is recorded in the session
    std::ignore = run_archive(session_id).discard_result().handle_exception([session_id] (std::exception_ptr ex) {
        sessionl.debug("Background archiving of session {} ended with {}", session_id, ex);
    }).finally([gh = std::move(gh)] {});
    co_return resp;
}

// Copies the only source, an archive already, to the result key.
future<uint64_t> upload_session_manager::publish(upload_session& s, const sstring& archive_object) {
    const auto& src = s.source_files.front();
    sessionl.info("Session {}: publishing {} as is", s.id, src.name);
    co_await _storage.copy_object(src.storage_key, archive_object);
    auto size = co_await _storage.head_object(archive_object);
    try {
        co_await _storage.delete_object(src.storage_key);
    } catch (...) {
        sessionl.warn("Failed to delete {}: {}", src.storage_key, std::current_exception());
    }
    s.archived_files = 1;
    co_await save_session(s);
    co_return size;
}

future<seal_response> upload_session_manager::run_archive(sstring session_id) {
    auto s = co_await load_session(session_id);
    std::optional<sstring> catalogued;
    std::exception_ptr ex;
    try {
        auto archive_id = make_random_id();
        // a republished archive keeps the name it was uploaded with
        auto file_name = is_passthrough(s) ? s.source_files.front().name : sstring(archive_file_name);
        auto object = archive_object_key(archive_id, file_name);
        uint64_t size = 0;
        if (is_passthrough(s)) {
            size = co_await publish(s, object);
        } else {
            std::vector<archive::source_object> sources;
            for (const auto& f : s.source_files) {
                sources.push_back(archive::source_object{f.name, f.storage_key});
            }
            auto result = co_await _builder.build(object, std::move(sources), s.sealed_at.value_or(clock_type::now()),
                    [this, &s] (unsigned files_done) {
                s.archived_files = files_done;
                return save_session(s);
            });
            size = result.size;
        }

        auto now = clock_type::now();
        archive_record rec{
            .archive_id = archive_id,
            .file_name = file_name,
            .credential_hash = s.credential_hash,
            .size = size,
            .file_count = unsigned(s.source_files.size()),
            .created_at = now,
            .expires_at = now + _cfg.archive_ttl,
        };
        co_await _metadata.put(archive_key(archive_id), rec.to_json());
        catalogued = archive_id;
        s.result_archive_id = archive_id;
        co_await transition(s, session_state::done);
    } catch (...) {
        ex = std::current_exception();
    }

    if (!ex) {
        try {
            co_await _ledger.remove_session(session_id);
        } catch (...) {
            sessionl.warn("Failed to remove the chunk records of session {}: {}", session_id, std::current_exception());
        }
        co_return seal_response{s.state, s.result_archive_id};
    }

    sessionl.error("Archiving session {} failed: {}", session_id, ex);
    // only a done session points at an archive
    s.result_archive_id.reset();
    if (catalogued) {
        try {
            co_await _metadata.remove(archive_key(*catalogued));
        } catch (...) {
            sessionl.warn("Failed to remove the catalog entry of archive {}: {}", *catalogued, std::current_exception());
        }
    }
    try {
        co_await mark_failed(s, fmt::format("{}", ex));
    } catch (...) {
        sessionl.error("Failed to record the failure of session {}: {}", session_id, std::current_exception());
    }
    std::rethrow_exception(ex);
}

future<session_status> upload_session_manager::status(sstring session_id) {
    auto s = co_await load_session(session_id);
    session_status ret{
        .state = s.state,
        .archive_id = s.result_archive_id,
        .error = s.error,
    };
    switch (s.state) {
    case session_state::ingesting:
        ret.progress = fraction(co_await _ledger.uploaded_count(session_id), s.total_chunks());
        break;
    case session_state::sealed:
    case session_state::done:
        ret.progress = 1.0;
        break;
    case session_state::archiving:
        ret.progress = fraction(s.archived_files, s.source_files.size());
        break;
    case session_state::failed:
        if (s.sealed_at) {
            ret.progress = fraction(s.archived_files, s.source_files.size());
        } else {
            ret.progress = fraction(co_await _ledger.uploaded_count(session_id), s.total_chunks());
        }
        break;
    }
    co_return ret;
}

future<> upload_session_manager::discard(sstring session_id) {
    return _locks.with_lock(session_id, [this, session_id] () -> future<> {
        auto s = co_await load_session(session_id);
        if (s.state == session_state::archiving) {
            throw invalid_input_error(fmt::format("session {} is being archived", session_id));
        }
        co_await abort_uploads(s.source_files);
        if (s.state != session_state::done) {
            for (const auto& f : s.source_files) {
                if (!f.remote_completed) {
                    continue;
                }
                try {
                    co_await _storage.delete_object(f.storage_key);
                } catch (...) {
                    sessionl.warn("Failed to delete {}: {}", f.storage_key, std::current_exception());
                }
            }
        }
        co_await _ledger.remove_session(session_id);
        co_await _metadata.remove(session_key(session_id));
        sessionl.info("Session {} discarded in state {}", session_id, s.state);
    });
}

future<> upload_session_manager::stop() {
    sessionl.info("Waiting for background archives");
    co_await _background.close();
}

} // namespace ingest
