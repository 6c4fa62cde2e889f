/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include <algorithm>
#include <charconv>
#include <functional>
#include <iterator>
#include <stdexcept>
#include <seastar/core/coroutine.hh>
#include <seastar/core/loop.hh>
#include <seastar/coroutine/exception.hh>

#include "ingest/chunk_ledger.hh"
#include "ingest/exceptions.hh"
#include "utils/log.hh"

namespace ingest {

static logging::logger ledgerl("ledger");

chunk_ledger::chunk_ledger(kv::metadata_store& store, ledger_config cfg)
    : _store(store)
    , _cfg(cfg)
{
    if (_cfg.list_page_size == 0 || _cfg.fetch_concurrency == 0) {
        throw std::invalid_argument("ledger page size and fetch concurrency must be positive");
    }
}

future<uint64_t> chunk_ledger::read_counter(const sstring& session_id) {
    auto value = co_await _store.get(counter_key(session_id));
    if (!value) {
        co_return 0;
    }
    uint64_t count = 0;
    auto [ptr, ec] = std::from_chars(value->data(), value->data() + value->size(), count);
    if (ec != std::errc() || ptr != value->data() + value->size()) {
        throw std::runtime_error(format("malformed chunk counter of session {}: '{}'", session_id, *value));
    }
    co_return count;
}

future<confirm_result> chunk_ledger::confirm(sstring session_id, sstring file_name, unsigned chunk_index, unsigned part_number, sstring etag) {
    return _locks.with_lock(session_id, [this, session_id, file_name, chunk_index, part_number, etag] () -> future<confirm_result> {
        auto key = chunk_key(session_id, file_name, chunk_index);
        auto existing = co_await _store.get(key);
        if (existing) {
            auto rec = chunk_record::from_json(*existing);
            if (rec.remote_etag != etag) {
                co_await coroutine::return_exception(remote_inconsistency_error(format(
                        "chunk {} of {} in session {} was confirmed with ETag {}, now {}",
                        chunk_index, file_name, session_id, rec.remote_etag, etag)));
            }
            ledgerl.debug("Replayed confirmation of chunk {} of {} in session {}", chunk_index, file_name, session_id);
            co_return confirm_result{false, co_await read_counter(session_id)};
        }

        chunk_record rec{
            .file_name = file_name,
            .chunk_index = chunk_index,
            .part_number = part_number,
            .remote_etag = etag,
            .confirmed_at = clock_type::now(),
        };
        co_await _store.put(key, rec.to_json());
        auto count = co_await read_counter(session_id) + 1;
        co_await _store.put(counter_key(session_id), to_sstring(count));
        ledgerl.debug("Confirmed chunk {} of {} in session {} ({} so far)", chunk_index, file_name, session_id, count);
        co_return confirm_result{true, count};
    });
}

future<std::optional<chunk_record>> chunk_ledger::find(sstring session_id, sstring file_name, unsigned chunk_index) {
    auto value = co_await _store.get(chunk_key(session_id, file_name, chunk_index));
    if (!value) {
        co_return std::nullopt;
    }
    co_return chunk_record::from_json(*value);
}

future<std::vector<sstring>> chunk_ledger::list_keys(sstring prefix) {
    std::vector<sstring> keys;
    sstring cursor;
    do {
        auto page = co_await _store.list(prefix, cursor, _cfg.list_page_size);
        std::move(page.keys.begin(), page.keys.end(), std::back_inserter(keys));
        cursor = std::move(page.cursor);
    } while (!cursor.empty());
    co_return keys;
}

future<std::vector<chunk_record>> chunk_ledger::list_confirmed(sstring session_id, sstring file_name) {
    auto prefix = chunk_file_prefix(session_id, file_name);
    std::vector<chunk_record> ret;
    sstring cursor;
    do {
        auto page = co_await _store.list(prefix, cursor, _cfg.list_page_size);
        co_await max_concurrent_for_each(page.keys, _cfg.fetch_concurrency, [this, &ret] (const sstring& key) -> future<> {
            auto value = co_await _store.get(key);
            // removed since listed
            if (value) {
                ret.push_back(chunk_record::from_json(*value));
            }
        });
        cursor = std::move(page.cursor);
    } while (!cursor.empty());

    std::ranges::sort(ret, std::less<>(), &chunk_record::part_number);
    ledgerl.trace("Listed {} confirmed chunks of {} in session {}", ret.size(), file_name, session_id);
    co_return ret;
}

future<uint64_t> chunk_ledger::uploaded_count(sstring session_id) {
    return read_counter(session_id);
}

future<uint64_t> chunk_ledger::recount(sstring session_id) {
    return _locks.with_lock(session_id, [this, session_id] () -> future<uint64_t> {
        auto keys = co_await list_keys(chunk_prefix(session_id));
        uint64_t count = keys.size();
        co_await _store.put(counter_key(session_id), to_sstring(count));
        ledgerl.info("Recounted session {}: {} chunks", session_id, count);
        co_return count;
    });
}

future<> chunk_ledger::remove_session(sstring session_id) {
    return _locks.with_lock(session_id, [this, session_id] () -> future<> {
        auto keys = co_await list_keys(chunk_prefix(session_id));
        co_await max_concurrent_for_each(keys, _cfg.fetch_concurrency, [this] (const sstring& key) {
            return _store.remove(key);
        });
        co_await _store.remove(counter_key(session_id));
        ledgerl.debug("Removed {} chunk records of session {}", keys.size(), session_id);
    });
}

} // namespace ingest
