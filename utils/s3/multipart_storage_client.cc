/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include <stdexcept>
#include <fmt/format.h>
#include <seastar/core/coroutine.hh>

#include "utils/s3/client.hh"
#include "utils/s3/multipart_storage_client.hh"
#include "utils/s3/utils/client_utils.hh"

namespace s3 {

std::exception_ptr make_storage_error(std::exception_ptr ex) {
    try {
        map_s3_client_exception(std::move(ex));
    } catch (...) {
        return std::current_exception();
    }
}

multipart_storage_client::multipart_storage_client(shared_ptr<object_store> store, storage_client_config cfg,
        std::unique_ptr<aws::retry_strategy> retry_strategy, utils::pipeline_observer& observer)
    : _store(std::move(store))
    , _cfg(std::move(cfg))
    , _retry_strategy(std::move(retry_strategy))
    , _observer(observer)
{
    if (_cfg.bucket.empty()) {
        throw std::invalid_argument("storage bucket is not configured");
    }
}

multipart_storage_client::multipart_storage_client(shared_ptr<object_store> store, storage_client_config cfg,
        aws::retry_config retry_cfg, utils::pipeline_observer& observer)
    : multipart_storage_client(std::move(store), std::move(cfg), std::make_unique<aws::default_retry_strategy>(retry_cfg), observer)
{}

sstring multipart_storage_client::object_name(std::string_view key) const {
    return format("/{}/{}", _cfg.bucket, key);
}

future<sstring> multipart_storage_client::create_multipart(sstring key, abort_source* as) {
    auto name = object_name(key);
    auto id = co_await call(format("create multipart upload for {}", key), as, [this, &name] (abort_source* call_as) {
        return _store->create_multipart_upload(name, call_as);
    });
    s3l.debug("Created multipart upload {} for {}", id, key);
    co_return id;
}

future<presigned_request> multipart_storage_client::authorize_part_upload(sstring key, sstring multipart_id, unsigned part_number) {
    if (part_number == 0 || part_number > aws_maximum_parts_in_piece) {
        throw std::invalid_argument(fmt::format("part number {} is out of range", part_number));
    }
    return _store->presign_upload_part(object_name(key), std::move(multipart_id), part_number);
}

future<sstring> multipart_storage_client::upload_part(sstring key, sstring multipart_id, unsigned part_number, temporary_buffer<char> data, abort_source* as) {
    auto name = object_name(key);
    auto size = data.size();
    auto etag = co_await call(format("upload part {} of {}", part_number, key), as, [&] (abort_source* call_as) {
        return _store->upload_part(name, multipart_id, part_number, data.share(), call_as);
    });
    _observer.on_part_uploaded(name, part_number, size);
    co_return etag;
}

future<> multipart_storage_client::complete_multipart(sstring key, sstring multipart_id, std::vector<completed_part> parts, abort_source* as) {
    // validates the list before anything goes out
    complete_multipart_upload_request request(std::move(parts));
    auto name = object_name(key);
    co_await call(format("complete multipart upload of {}", key), as, [&] (abort_source* call_as) {
        return _store->complete_multipart_upload(name, multipart_id, request.parts(), call_as);
    });
    s3l.debug("Completed multipart upload {} of {} ({} parts)", multipart_id, key, request.parts().size());
}

future<> multipart_storage_client::abort_multipart(sstring key, sstring multipart_id) noexcept {
    auto name = object_name(key);
    try {
        co_await call(format("abort multipart upload of {}", key), nullptr, [&] (abort_source* call_as) {
            return _store->abort_multipart_upload(name, multipart_id, call_as);
        });
        s3l.debug("Aborted multipart upload {} of {}", multipart_id, key);
    } catch (...) {
        s3l.warn("Failed to abort multipart upload {} of {}: {}", multipart_id, key, std::current_exception());
    }
}

future<uint64_t> multipart_storage_client::head_object(sstring key, abort_source* as) {
    auto name = object_name(key);
    return call(format("head {}", key), as, [this, name = std::move(name)] (abort_source* call_as) {
        return _store->get_object_size(name, call_as);
    });
}

future<temporary_buffer<char>> multipart_storage_client::get_range(sstring key, uint64_t start, uint64_t end, abort_source* as) {
    if (end < start) {
        throw std::invalid_argument(fmt::format("invalid range {}-{} of {}", start, end, key));
    }
    auto name = object_name(key);
    auto r = range{start, size_t(end - start + 1)};
    auto buf = co_await call(format("get {} bytes={}-{}", key, start, end), as, [&] (abort_source* call_as) {
        return _store->get_object_contiguous(name, r, call_as);
    });
    co_return buf;
}

future<temporary_buffer<char>> multipart_storage_client::get_object(sstring key, abort_source* as) {
    auto name = object_name(key);
    auto buf = co_await call(format("get {}", key), as, [&] (abort_source* call_as) {
        return _store->get_object_contiguous(name, std::nullopt, call_as);
    });
    co_return buf;
}

future<> multipart_storage_client::delete_object(sstring key, abort_source* as) {
    auto name = object_name(key);
    co_await call(format("delete {}", key), as, [&] (abort_source* call_as) {
        return _store->delete_object(name, call_as);
    });
}

future<> multipart_storage_client::copy_object(sstring source_key, sstring target_key, abort_source* as) {
    auto source = object_name(source_key);
    auto target = object_name(target_key);
    co_await call(format("copy {} to {}", source_key, target_key), as, [&] (abort_source* call_as) {
        return _store->copy_object(source, target, call_as);
    });
    s3l.debug("Copied {} to {}", source_key, target_key);
}

} // namespace s3
