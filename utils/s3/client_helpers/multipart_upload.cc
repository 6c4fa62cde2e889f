/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "multipart_upload.hh"

#include <seastar/core/coroutine.hh>
#include <seastar/coroutine/exception.hh>

#include "utils/s3/utils/client_utils.hh"

namespace s3 {

multipart_upload::multipart_upload(seastar::shared_ptr<client> cln, seastar::sstring object_name, seastar::abort_source* as)
    : _client(std::move(cln)), _object_name(std::move(object_name)), _as(as) {
}

bool multipart_upload::upload_started() const noexcept {
    return !_upload_id.empty();
}

seastar::future<> multipart_upload::start_upload() {
    _upload_id = co_await _client->create_multipart_upload(_object_name, _as);
}

seastar::future<> multipart_upload::finalize_upload() {
    s3l.trace("wait for {} parts to complete (upload id {})", _part_etags.size(), _upload_id);
    co_await _bg_flushes.close();

    std::vector<completed_part> parts;
    parts.reserve(_part_etags.size());
    for (unsigned i = 0; i < _part_etags.size(); ++i) {
        if (_part_etags[i].empty()) {
            co_await seastar::coroutine::return_exception(std::runtime_error(
                    seastar::format("part {} of {} failed, cannot complete upload {}", i + 1, _object_name, _upload_id)));
        }
        parts.push_back(completed_part{i + 1, _part_etags[i]});
    }
    co_await _client->complete_multipart_upload(_object_name, _upload_id, std::move(parts), _as);
    _upload_id = ""; // now upload_started() returns false
}

seastar::future<> multipart_upload::abort_upload() noexcept {
    s3l.trace("DELETE upload {}", _upload_id);
    try {
        co_await _client->abort_multipart_upload(_object_name, std::exchange(_upload_id, ""));
    } catch (...) {
        s3l.warn("Failed to abort upload of {}: {}", _object_name, std::current_exception());
    }
}

} // namespace s3
