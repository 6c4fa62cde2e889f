/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <vector>
#include <seastar/core/abort_source.hh>
#include <seastar/core/future.hh>
#include <seastar/core/sstring.hh>
#include <seastar/core/temporary_buffer.hh>
#include <seastar/core/units.hh>

namespace s3 {

using namespace seastar;

// "Each part must be at least 5 MB in size, except the last part."
// https://docs.aws.amazon.com/AmazonS3/latest/API/API_UploadPart.html
inline constexpr size_t aws_minimum_part_size = 5_MiB;
inline constexpr size_t aws_maximum_part_size = 5_GiB;
// "Part numbers can be any number from 1 to 10,000, inclusive."
inline constexpr unsigned aws_maximum_parts_in_piece = 10'000;

struct range {
    uint64_t off;
    size_t len;
};

// One uploaded part as the complete call needs it.
struct completed_part {
    unsigned part_number;
    sstring etag;
    bool operator==(const completed_part&) const = default;
};

// Pre-authorized direct upload of one part. The holder can PUT the part body
// to url with headers without any further credentials. The signature is bound
// to the x-amz-date header, so the provider rejects it once that date is too
// old (15 minutes for AWS).
struct presigned_request {
    sstring method;
    sstring url;
    std::map<sstring, sstring> headers;
};

// The subset of the S3 protocol the ingestion pipeline drives. Object names
// are bucket-qualified paths ("/bucket/key"). None of the calls retry; that
// is the job of multipart_storage_client.
class object_store {
public:
    virtual ~object_store() = default;

    virtual future<sstring> create_multipart_upload(sstring object_name, abort_source* as = nullptr) = 0;
    virtual future<sstring> upload_part(sstring object_name, sstring upload_id, unsigned part_number, temporary_buffer<char> data, abort_source* as = nullptr) = 0;
    // parts must be sorted by part number
    virtual future<> complete_multipart_upload(sstring object_name, sstring upload_id, std::vector<completed_part> parts, abort_source* as = nullptr) = 0;
    virtual future<> abort_multipart_upload(sstring object_name, sstring upload_id, abort_source* as = nullptr) = 0;
    virtual future<presigned_request> presign_upload_part(sstring object_name, sstring upload_id, unsigned part_number) = 0;

    virtual future<uint64_t> get_object_size(sstring object_name, abort_source* as = nullptr) = 0;
    virtual future<temporary_buffer<char>> get_object_contiguous(sstring object_name, std::optional<range> range = {}, abort_source* as = nullptr) = 0;
    virtual future<> delete_object(sstring object_name, abort_source* as = nullptr) = 0;
    virtual future<> copy_object(sstring source_object, sstring target_object, abort_source* as = nullptr) = 0;

    virtual future<> close() = 0;
};

} // namespace s3
