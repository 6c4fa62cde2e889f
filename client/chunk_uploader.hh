/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <memory>
#include <seastar/core/file.hh>
#include <seastar/util/noncopyable_function.hh>

#include "client/part_transport.hh"
#include "utils/observer.hh"
#include "utils/s3/retry_strategy.hh"

namespace client {

// Reads len bytes of the source at offset.
using chunk_reader = noncopyable_function<future<temporary_buffer<char>>(uint64_t offset, size_t len)>;
// Reports an uploaded chunk to the session manager.
using chunk_confirmer = noncopyable_function<future<>(unsigned chunk_index, unsigned part_number, sstring etag)>;

chunk_reader make_file_chunk_reader(file f);

struct uploader_config {
    unsigned workers = 3;
    aws::retry_config retry;
};

struct upload_stats {
    unsigned chunks = 0;
    uint64_t bytes = 0;
};

// Uploads the chunks of one file with a pool of workers. Every worker claims
// the next chunk index, reads the chunk, PUTs it to its pre-authorized part
// request and confirms it only once the storage accepted it. Both the PUT
// and the confirmation are retried.
//
// The first failure or an abort stops the workers from claiming more chunks;
// the running ones finish and the error is rethrown.
class chunk_uploader {
    part_transport& _transport;
    uploader_config _cfg;
    std::unique_ptr<aws::retry_strategy> _retry_strategy;
    utils::pipeline_observer& _observer;
public:
    chunk_uploader(part_transport& transport, uploader_config cfg = {}, utils::pipeline_observer& observer = utils::noop_observer());
    chunk_uploader(part_transport& transport, uploader_config cfg, std::unique_ptr<aws::retry_strategy> retry_strategy,
            utils::pipeline_observer& observer = utils::noop_observer());

    future<upload_stats> upload(const ingest::file_descriptor& fd, uint64_t chunk_size, uint64_t file_size,
            chunk_reader read, chunk_confirmer confirm, abort_source* as = nullptr);
};

} // namespace client
