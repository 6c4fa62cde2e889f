/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <map>
#include <optional>
#include <string>
#include <unordered_map>

#include "utils/s3/object_store.hh"

namespace tests {

// In-process S3 with the multipart rules that matter to the pipeline:
// unknown uploads are NoSuchUpload, completion checks the part list and the
// minimum part size, and ETags are derived from the part content.
//
// Failures can be injected per operation. The operation names are the
// object_store method names ("create_multipart_upload", "upload_part", ...).
class memory_object_store final : public s3::object_store {
public:
    enum class failure : uint8_t {
        // 503 SlowDown, retryable
        retryable,
        // 400 InvalidRequest, not retryable
        non_retryable,
        // hangs until the call is aborted
        stall,
    };
private:
    struct injected {
        failure kind;
        unsigned remaining;
    };
    struct part {
        std::string data;
        sstring etag;
    };
    struct upload {
        sstring object_name;
        std::map<unsigned, part> parts;
    };

    std::map<sstring, std::string> _objects;
    std::unordered_map<sstring, upload> _uploads;
    std::map<sstring, std::vector<uint64_t>> _completed_part_sizes;
    std::unordered_map<sstring, injected> _failures;
    std::unordered_map<sstring, unsigned> _calls;
    unsigned _next_upload_id = 0;
    unsigned _aborted_uploads = 0;
    unsigned _parts_inflight = 0;
    unsigned _max_parts_inflight = 0;
    size_t _min_part_size = s3::aws_minimum_part_size;

    future<> enter(const char* op, abort_source* as);
public:
    // Fails the next count calls of op.
    void inject(sstring op, failure kind, unsigned count = 1);
    void clear_failures() noexcept { _failures.clear(); }
    void set_min_part_size(size_t size) noexcept { _min_part_size = size; }

    void put(sstring object_name, std::string data);
    std::optional<std::string> get(const sstring& object_name) const;
    bool contains(const sstring& object_name) const { return _objects.contains(object_name); }
    size_t objects() const noexcept { return _objects.size(); }
    // Uploads neither completed nor aborted.
    size_t pending_uploads() const noexcept { return _uploads.size(); }
    unsigned aborted_uploads() const noexcept { return _aborted_uploads; }
    unsigned calls(const sstring& op) const;
    // Most upload_part calls in progress at the same time.
    unsigned max_parts_inflight() const noexcept { return _max_parts_inflight; }
    // Part sizes of a completed multipart upload, in part order.
    const std::vector<uint64_t>& completed_part_sizes(const sstring& object_name) const;

    future<sstring> create_multipart_upload(sstring object_name, abort_source* as = nullptr) override;
    future<sstring> upload_part(sstring object_name, sstring upload_id, unsigned part_number, temporary_buffer<char> data, abort_source* as = nullptr) override;
    future<> complete_multipart_upload(sstring object_name, sstring upload_id, std::vector<s3::completed_part> parts, abort_source* as = nullptr) override;
    future<> abort_multipart_upload(sstring object_name, sstring upload_id, abort_source* as = nullptr) override;
    future<s3::presigned_request> presign_upload_part(sstring object_name, sstring upload_id, unsigned part_number) override;

    future<uint64_t> get_object_size(sstring object_name, abort_source* as = nullptr) override;
    future<temporary_buffer<char>> get_object_contiguous(sstring object_name, std::optional<s3::range> range = {}, abort_source* as = nullptr) override;
    future<> delete_object(sstring object_name, abort_source* as = nullptr) override;
    future<> copy_object(sstring source_object, sstring target_object, abort_source* as = nullptr) override;

    future<> close() override;

    // Stores an uploaded chunk the way a client PUT to a pre-authorized part
    // request would.
    sstring put_part(const sstring& object_name, const sstring& upload_id, unsigned part_number, std::string data);
};

} // namespace tests
