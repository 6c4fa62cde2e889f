/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once
#include <vector>
#include "seastar/core/iostream.hh"
#include <seastar/core/sstring.hh>
#include "utils/log.hh"
#include "utils/s3/object_store.hh"

namespace s3 {

extern logging::logger s3l;

// Typed model of the CompleteMultipartUpload request. The part list is
// validated on construction (non-empty, strictly ascending part numbers in
// [1, 10000], non-empty ETags) and serialized to the XML body S3 expects.
class complete_multipart_upload_request {
    std::vector<completed_part> _parts;

public:
    explicit complete_multipart_upload_request(std::vector<completed_part> parts);

    const std::vector<completed_part>& parts() const noexcept { return _parts; }
    seastar::sstring to_xml() const;
};

struct complete_multipart_upload_result {
    seastar::sstring location;
    seastar::sstring bucket;
    seastar::sstring key;
    seastar::sstring etag;
};

seastar::sstring parse_multipart_upload_id(seastar::sstring& body);
// S3 may report a failed completion with a 200 status and an <Error> body,
// such responses are thrown as aws::aws_exception.
complete_multipart_upload_result parse_complete_multipart_upload_result(seastar::sstring& body);
seastar::future<> write_body(seastar::output_stream<char> out, seastar::sstring body);
seastar::sstring parse_multipart_copy_upload_etag(seastar::sstring& body);
seastar::sstring xml_escape(std::string_view text);

} // namespace s3
