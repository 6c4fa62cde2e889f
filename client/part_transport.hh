/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <seastar/core/abort_source.hh>
#include <seastar/core/future.hh>
#include <seastar/core/sstring.hh>
#include <seastar/core/temporary_buffer.hh>

#include "ingest/upload_session_manager.hh"

namespace client {

using namespace seastar;

// Sends one chunk to its pre-authorized part request and returns the ETag
// the storage assigned to it. Implementations do not retry.
class part_transport {
public:
    virtual ~part_transport() = default;

    virtual future<sstring> put_part(const ingest::part_descriptor& part, temporary_buffer<char> data, abort_source* as = nullptr) = 0;
    virtual future<> close() = 0;
};

} // namespace client
