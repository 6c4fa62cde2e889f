/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <vector>
#include <seastar/core/abort_source.hh>
#include <seastar/core/gate.hh>
#include <seastar/core/shared_ptr.hh>
#include <seastar/core/sstring.hh>

#include "utils/s3/client.hh"

namespace s3 {

// Common state of a multi-request upload driven against s3::client. Parts may
// run in the background under _bg_flushes; a part that failed leaves its ETag
// empty and finalize_upload() refuses to complete the upload.
class multipart_upload {
protected:
    seastar::shared_ptr<client> _client;
    seastar::sstring _object_name;
    seastar::sstring _upload_id;
    std::vector<seastar::sstring> _part_etags;
    seastar::gate _bg_flushes;
    seastar::abort_source* _as;

    seastar::future<> start_upload();
    seastar::future<> finalize_upload();
    seastar::future<> abort_upload() noexcept;

public:
    multipart_upload(seastar::shared_ptr<client> cln, seastar::sstring object_name, seastar::abort_source* as);

    bool upload_started() const noexcept;
};

} // namespace s3
