/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <chrono>
#include <memory>
#include <vector>
#include <seastar/core/abort_source.hh>
#include <seastar/core/coroutine.hh>
#include <seastar/core/shared_ptr.hh>
#include <seastar/coroutine/exception.hh>

#include "utils/observer.hh"
#include "utils/s3/object_store.hh"
#include "utils/s3/retry.hh"
#include "utils/s3/retry_strategy.hh"

namespace s3 {

struct storage_client_config {
    sstring bucket;
    // Deadline of every single attempt, retries get a fresh one.
    std::chrono::milliseconds call_timeout{std::chrono::seconds(180)};
};

// Maps the error that survived the retries to storage_io_error and returns it
// as exception_ptr (see map_s3_client_exception).
std::exception_ptr make_storage_error(std::exception_ptr ex);

// Key-addressed view of the bucket. Every call runs under the retry policy
// and every attempt gets its own deadline. Errors that survive the retries
// leave as storage_io_error.
class multipart_storage_client {
    shared_ptr<object_store> _store;
    storage_client_config _cfg;
    std::unique_ptr<aws::retry_strategy> _retry_strategy;
    utils::pipeline_observer& _observer;

    template <typename Func>
    std::invoke_result_t<Func&, abort_source*> call(sstring label, abort_source* as, Func func) {
        std::exception_ptr ex;
        try {
            co_return co_await with_retry(*_retry_strategy, _observer, std::move(label), [this, as, &func] {
                return with_deadline(_cfg.call_timeout, as, [&func] (abort_source* call_as) { return func(call_as); });
            }, as);
        } catch (...) {
            ex = std::current_exception();
        }
        co_await coroutine::return_exception_ptr(make_storage_error(std::move(ex)));
    }
public:
    multipart_storage_client(shared_ptr<object_store> store, storage_client_config cfg,
            std::unique_ptr<aws::retry_strategy> retry_strategy, utils::pipeline_observer& observer = utils::noop_observer());
    multipart_storage_client(shared_ptr<object_store> store, storage_client_config cfg,
            aws::retry_config retry_cfg = {}, utils::pipeline_observer& observer = utils::noop_observer());

    const storage_client_config& config() const noexcept { return _cfg; }
    const aws::retry_strategy& get_retry_strategy() const noexcept { return *_retry_strategy; }
    // "/bucket/key"
    sstring object_name(std::string_view key) const;

    future<sstring> create_multipart(sstring key, abort_source* as = nullptr);
    // Direct PUT of one part by a holder without credentials.
    future<presigned_request> authorize_part_upload(sstring key, sstring multipart_id, unsigned part_number);
    future<sstring> upload_part(sstring key, sstring multipart_id, unsigned part_number, temporary_buffer<char> data, abort_source* as = nullptr);
    // Parts must be sorted by part number and unique, std::invalid_argument
    // is thrown before anything is sent otherwise.
    future<> complete_multipart(sstring key, sstring multipart_id, std::vector<completed_part> parts, abort_source* as = nullptr);
    // Best effort, failures are only logged.
    future<> abort_multipart(sstring key, sstring multipart_id) noexcept;

    future<uint64_t> head_object(sstring key, abort_source* as = nullptr);
    // Bytes [start, end], both inclusive like an HTTP Range.
    future<temporary_buffer<char>> get_range(sstring key, uint64_t start, uint64_t end, abort_source* as = nullptr);
    future<temporary_buffer<char>> get_object(sstring key, abort_source* as = nullptr);
    future<> delete_object(sstring key, abort_source* as = nullptr);
    future<> copy_object(sstring source_key, sstring target_key, abort_source* as = nullptr);
};

} // namespace s3
