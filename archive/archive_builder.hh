/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <chrono>
#include <stdexcept>
#include <vector>
#include <seastar/core/abort_source.hh>
#include <seastar/core/future.hh>
#include <seastar/core/sstring.hh>
#include <seastar/core/units.hh>
#include <seastar/util/noncopyable_function.hh>

#include "utils/s3/multipart_storage_client.hh"

namespace archive {

using namespace seastar;

struct builder_config {
    // Every part but the last one has exactly this size.
    size_t part_size = 50_MiB;
    // Bytes requested from a source per ranged read.
    size_t read_window = 10_MiB;
    unsigned max_inflight_parts = 4;
    // Slices buffered between the writer and the part assembler.
    size_t channel_capacity = 16;
    // Ceiling on waiting for the pending part uploads at the end of a run.
    std::chrono::milliseconds finalize_timeout{std::chrono::seconds(60)};
    bool delete_sources = true;
};

void validate(const builder_config& cfg);

struct source_object {
    // entry name inside the archive
    sstring name;
    // storage key
    sstring key;
};

struct archive_result {
    sstring key;
    uint64_t size = 0;
    unsigned file_count = 0;
    std::vector<s3::completed_part> parts;
    std::vector<uint64_t> part_sizes;
};

// Called after every packed source with the number packed so far.
using archive_progress = noncopyable_function<future<>(unsigned files_done)>;

class builder_failure_error : public std::runtime_error {
public:
    explicit builder_failure_error(const std::string& reason)
        : std::runtime_error(reason) {}
};

// Repacks source objects into one store-mode ZIP published with a multipart
// upload. Reading and packing feed a bounded channel; the other end cuts the
// stream into fixed size parts and uploads them in the background. Any
// failure aborts the channel and the multipart upload and is reported as
// builder_failure_error.
class archive_builder {
    s3::multipart_storage_client& _storage;
    builder_config _cfg;

    class run;
public:
    archive_builder(s3::multipart_storage_client& storage, builder_config cfg = {});

    const builder_config& config() const noexcept { return _cfg; }

    future<archive_result> build(sstring result_key, std::vector<source_object> sources,
            std::chrono::system_clock::time_point mtime, archive_progress progress = {}, abort_source* as = nullptr);
};

} // namespace archive
