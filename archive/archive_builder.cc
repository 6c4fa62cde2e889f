/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include <seastar/core/coroutine.hh>
#include <seastar/core/gate.hh>
#include <seastar/core/lowres_clock.hh>
#include <seastar/core/queue.hh>
#include <seastar/core/semaphore.hh>
#include <seastar/core/shared_future.hh>
#include <seastar/core/timed_out_error.hh>
#include <seastar/core/when_all.hh>

#include "archive/archive_builder.hh"
#include "archive/part_assembler.hh"
#include "archive/zip_writer.hh"
#include "utils/log.hh"

namespace archive {

static logging::logger archl("archive");

void validate(const builder_config& cfg) {
    if (cfg.part_size < s3::aws_minimum_part_size || cfg.part_size > s3::aws_maximum_part_size) {
        throw std::invalid_argument(fmt::format("archive part size {} is outside of [{}, {}]", cfg.part_size, s3::aws_minimum_part_size, s3::aws_maximum_part_size));
    }
    if (cfg.read_window == 0 || cfg.max_inflight_parts == 0 || cfg.channel_capacity == 0) {
        throw std::invalid_argument("archive read window, in-flight parts and channel capacity must be positive");
    }
}

class archive_builder::run {
    archive_builder& _builder;
    sstring _key;
    std::vector<source_object> _sources;
    std::chrono::system_clock::time_point _mtime;
    archive_progress _progress;

    sstring _upload_id;
    abort_source _as;
    optimized_optional<abort_source::subscription> _outer_sub;
    // nullopt marks the end of the archive
    queue<std::optional<temporary_buffer<char>>> _channel;
    part_assembler _assembler;
    gate _uploads;
    semaphore _inflight;
    std::vector<sstring> _etags;
    std::vector<uint64_t> _part_sizes;
    uint64_t _archive_size = 0;
    std::exception_ptr _error;

    s3::multipart_storage_client& storage() noexcept { return _builder._storage; }
    const builder_config& cfg() const noexcept { return _builder._cfg; }

    // The first error wins, the rest only stop the run faster.
    void fail(std::exception_ptr ex) noexcept {
        if (!_error) {
            archl.warn("Building {} failed: {}", _key, ex);
            _error = ex;
        }
        if (!_as.abort_requested()) {
            _as.request_abort();
        }
        _channel.abort(ex);
    }

    future<> pack(zip_writer& writer, const source_object& src) {
        std::optional<uint64_t> size;
        std::exception_ptr head_error;
        try {
            size = co_await storage().head_object(src.key, &_as);
        } catch (...) {
            head_error = std::current_exception();
        }

        if (!size) {
            if (_as.abort_requested()) {
                std::rethrow_exception(head_error);
            }
            archl.warn("Cannot get the size of {} ({}), reading it whole", src.key, head_error);
            auto whole = co_await storage().get_object(src.key, &_as);
            co_await writer.begin_entry(std::string(src.name), whole.size());
            for (size_t off = 0; off < whole.size(); off += cfg().read_window) {
                co_await writer.write(whole.share(off, std::min(cfg().read_window, whole.size() - off)));
            }
            co_await writer.end_entry();
            co_return;
        }

        archl.debug("Packing {} ({} bytes) as {}", src.key, *size, src.name);
        co_await writer.begin_entry(std::string(src.name), *size);
        uint64_t off = 0;
        while (off < *size) {
            uint64_t len = std::min<uint64_t>(cfg().read_window, *size - off);
            auto buf = co_await storage().get_range(src.key, off, off + len - 1, &_as);
            if (buf.size() != len) {
                throw builder_failure_error(fmt::format("short read of {} at offset {}: {} of {} bytes", src.key, off, buf.size(), len));
            }
            off += len;
            co_await writer.write(std::move(buf));
        }
        if (writer.current_entry_size() != *size) {
            throw builder_failure_error(fmt::format("{} has {} bytes, expected {}", src.key, writer.current_entry_size(), *size));
        }
        co_await writer.end_entry();
    }

    future<> produce() {
        try {
            zip_writer writer([this] (temporary_buffer<char> buf) {
                return _channel.push_eventually(std::move(buf));
            }, _mtime);
            unsigned done = 0;
            for (const auto& src : _sources) {
                _as.check();
                co_await pack(writer, src);
                ++done;
                if (_progress) {
                    co_await _progress(done);
                }
            }
            co_await writer.finish();
            _archive_size = writer.bytes_written();
            co_await _channel.push_eventually(std::nullopt);
        } catch (...) {
            fail(std::current_exception());
        }
    }

    future<> launch_upload(temporary_buffer<char> part) {
        auto units = co_await get_units(_inflight, 1, _as);
        unsigned part_number = _etags.size() + 1;
        if (part_number > s3::aws_maximum_parts_in_piece) {
            throw builder_failure_error(fmt::format("{} needs more than {} parts", _key, s3::aws_maximum_parts_in_piece));
        }
        _etags.emplace_back();
        _part_sizes.push_back(part.size());
        archl.debug("Uploading part {} of {} ({} bytes)", part_number, _key, part.size());

        // not awaited, joined by closing the gate
        auto gh = _uploads.hold();
        std::ignore = storage().upload_part(_key, _upload_id, part_number, std::move(part), &_as)
            .then([this, part_number] (sstring etag) {
                _etags[part_number - 1] = std::move(etag);
            })
            .handle_exception([this, part_number] (std::exception_ptr ex) {
                archl.debug("Part {} of {} failed: {}", part_number, _key, ex);
                fail(std::move(ex));
            })
            .finally([gh = std::move(gh), units = std::move(units)] {});
    }

    future<> consume() {
        try {
            while (auto slice = co_await _channel.pop_eventually()) {
                for (auto& part : _assembler.push(std::move(*slice))) {
                    co_await launch_upload(std::move(part));
                }
            }
            if (auto last = _assembler.finish()) {
                co_await launch_upload(std::move(*last));
            }
        } catch (...) {
            fail(std::current_exception());
        }
    }

    future<> join_uploads() {
        shared_future<> closed(_uploads.close());
        bool expired = false;
        try {
            co_await closed.get_future(lowres_clock::now() + cfg().finalize_timeout);
        } catch (const timed_out_error&) {
            expired = true;
        }
        if (expired) {
            fail(std::make_exception_ptr(builder_failure_error(
                    fmt::format("pending part uploads of {} did not finish within {}ms", _key, cfg().finalize_timeout.count()))));
            // the abort cancels the stragglers
            co_await closed.get_future();
        }
    }

public:
    run(archive_builder& builder, sstring key, std::vector<source_object> sources, std::chrono::system_clock::time_point mtime, archive_progress progress)
        : _builder(builder)
        , _key(std::move(key))
        , _sources(std::move(sources))
        , _mtime(mtime)
        , _progress(std::move(progress))
        , _channel(builder._cfg.channel_capacity)
        , _assembler(builder._cfg.part_size)
        , _inflight(builder._cfg.max_inflight_parts)
    {}

    future<archive_result> execute(abort_source* outer) {
        if (outer) {
            outer->check();
            _outer_sub = outer->subscribe([this] () noexcept {
                fail(std::make_exception_ptr(abort_requested_exception()));
            });
        }

        std::exception_ptr ex;
        try {
            _upload_id = co_await storage().create_multipart(_key, &_as);
        } catch (...) {
            ex = std::current_exception();
        }
        if (ex) {
            throw builder_failure_error(fmt::format("cannot start the upload of {}: {}", _key, ex));
        }
        archl.info("Building {} from {} sources (upload id {})", _key, _sources.size(), _upload_id);

        co_await when_all(produce(), consume());
        co_await join_uploads();

        std::vector<s3::completed_part> parts;
        if (!_error) {
            for (unsigned i = 0; i < _etags.size(); ++i) {
                parts.push_back(s3::completed_part{i + 1, _etags[i]});
            }
            try {
                co_await storage().complete_multipart(_key, _upload_id, parts, &_as);
            } catch (...) {
                fail(std::current_exception());
            }
        }

        if (_error) {
            co_await storage().abort_multipart(_key, _upload_id);
            throw builder_failure_error(fmt::format("building {} failed: {}", _key, _error));
        }

        archl.info("Built {}: {} bytes in {} parts", _key, _archive_size, parts.size());
        if (cfg().delete_sources) {
            for (const auto& src : _sources) {
                try {
                    co_await storage().delete_object(src.key);
                } catch (...) {
                    archl.warn("Failed to delete source {}: {}", src.key, std::current_exception());
                }
            }
        }

        co_return archive_result{
            .key = _key,
            .size = _archive_size,
            .file_count = unsigned(_sources.size()),
            .parts = std::move(parts),
            .part_sizes = std::move(_part_sizes),
        };
    }
};

archive_builder::archive_builder(s3::multipart_storage_client& storage, builder_config cfg)
    : _storage(storage)
    , _cfg(cfg)
{
    validate(_cfg);
}

future<archive_result> archive_builder::build(sstring result_key, std::vector<source_object> sources,
        std::chrono::system_clock::time_point mtime, archive_progress progress, abort_source* as) {
    if (sources.empty()) {
        throw std::invalid_argument("an archive needs at least one source");
    }
    run r(*this, std::move(result_key), std::move(sources), mtime, std::move(progress));
    co_return co_await r.execute(as);
}

} // namespace archive
