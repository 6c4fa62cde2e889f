/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include <boost/range/irange.hpp>
#include <seastar/core/coroutine.hh>
#include <seastar/coroutine/exception.hh>
#include <seastar/coroutine/parallel_for_each.hh>

#include "client/chunk_uploader.hh"
#include "ingest/upload_session.hh"
#include "utils/log.hh"
#include "utils/s3/retry.hh"

namespace client {

static logging::logger uploaderl("uploader");

chunk_reader make_file_chunk_reader(file f) {
    return [f = std::move(f)] (uint64_t offset, size_t len) mutable {
        return f.dma_read_exactly<char>(offset, len);
    };
}

chunk_uploader::chunk_uploader(part_transport& transport, uploader_config cfg, utils::pipeline_observer& observer)
    : chunk_uploader(transport, cfg, std::make_unique<aws::default_retry_strategy>(cfg.retry), observer)
{}

chunk_uploader::chunk_uploader(part_transport& transport, uploader_config cfg, std::unique_ptr<aws::retry_strategy> retry_strategy,
        utils::pipeline_observer& observer)
    : _transport(transport)
    , _cfg(cfg)
    , _retry_strategy(std::move(retry_strategy))
    , _observer(observer)
{
    if (_cfg.workers == 0) {
        throw std::invalid_argument("the uploader needs at least one worker");
    }
}

future<upload_stats> chunk_uploader::upload(const ingest::file_descriptor& fd, uint64_t chunk_size, uint64_t file_size,
        chunk_reader read, chunk_confirmer confirm, abort_source* as) {
    if (chunk_size == 0) {
        throw std::invalid_argument("chunk size must be positive");
    }
    if (fd.total_chunks != ingest::total_chunks_for(file_size, chunk_size) || fd.parts.size() != fd.total_chunks) {
        throw std::invalid_argument(fmt::format("{}: {} bytes do not match {} chunks with {} part requests",
                fd.name, file_size, fd.total_chunks, fd.parts.size()));
    }

    abort_source pool_as;
    optimized_optional<abort_source::subscription> sub;
    if (as) {
        as->check();
        sub = as->subscribe([&pool_as] () noexcept {
            if (!pool_as.abort_requested()) {
                pool_as.request_abort();
            }
        });
    }

    unsigned next_chunk = 0;
    upload_stats stats;
    // the cause, not the aborts it triggered in the other workers
    std::exception_ptr first_error;

    auto worker = [&] (unsigned worker_id) -> future<> {
        while (!pool_as.abort_requested()) {
            unsigned idx = next_chunk++;
            if (idx >= fd.total_chunks) {
                co_return;
            }
            const auto& part = fd.parts[idx];
            uint64_t offset = uint64_t(idx) * chunk_size;
            size_t len = std::min(chunk_size, file_size - offset);
            try {
                auto data = co_await read(offset, len);
                if (data.size() != len) {
                    throw std::runtime_error(fmt::format("short read of {} at {}: {} of {} bytes", fd.name, offset, data.size(), len));
                }
                sstring label = seastar::format("{} chunk {}", fd.name, idx);
                auto etag = co_await s3::with_retry(*_retry_strategy, _observer, label, [&] {
                    return _transport.put_part(part, data.share(), &pool_as);
                }, &pool_as);
                co_await s3::with_retry(*_retry_strategy, _observer, label, [&] {
                    return confirm(idx, part.part_number, etag);
                }, &pool_as);
                uploaderl.debug("Worker {}: {} chunk {} uploaded as part {} ({} bytes)", worker_id, fd.name, idx, part.part_number, len);
                ++stats.chunks;
                stats.bytes += len;
            } catch (...) {
                if (!first_error) {
                    first_error = std::current_exception();
                }
                if (!pool_as.abort_requested()) {
                    uploaderl.warn("Uploading {} chunk {} failed: {}", fd.name, idx, std::current_exception());
                    pool_as.request_abort();
                }
            }
        }
    };

    unsigned workers = std::min(_cfg.workers, fd.total_chunks);
    uploaderl.info("Uploading {} ({} bytes, {} chunks) with {} workers", fd.name, file_size, fd.total_chunks, workers);
    co_await coroutine::parallel_for_each(boost::irange(0u, workers), worker);
    if (first_error) {
        co_await coroutine::return_exception_ptr(std::move(first_error));
    }
    if (as) {
        as->check();
    }
    uploaderl.info("Uploaded {}: {} chunks, {} bytes", fd.name, stats.chunks, stats.bytes);
    co_return stats;
}

} // namespace client
