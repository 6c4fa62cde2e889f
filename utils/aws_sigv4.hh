/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <chrono>
#include <map>
#include <string>
#include <string_view>

// AWS Signature Version 4 helpers.
// https://docs.aws.amazon.com/IAM/latest/UserGuide/create-signed-request.html
namespace utils::aws {

inline constexpr std::string_view unsigned_content = "UNSIGNED-PAYLOAD";

// "20260102T030405Z"
std::string format_time_point(std::chrono::system_clock::time_point tp);

// RFC 3986 percent-encoding of everything but the unreserved characters.
// Slashes are kept when encoding a path.
std::string uri_encode(std::string_view value, bool encode_slash = true);

// Sorted, encoded "k1=v1&k2=v2" as both the request line and the canonical
// request use it.
std::string canonical_query_string(const std::map<std::string, std::string>& query_parameters);

std::string sha256_hex(std::string_view data);

struct signing_params {
    std::string_view access_key_id;
    std::string_view secret_access_key;
    std::string_view region;
    std::string_view service;
    std::string_view amz_date;      // format_time_point() output
    std::string_view method;
    std::string_view canonical_uri; // already encoded path
    std::string_view canonical_query;
    // lower-case header name -> trimmed value, all of them are signed
    const std::map<std::string, std::string>& signed_headers;
    std::string_view payload_hash = unsigned_content;
};

// "host;x-amz-content-sha256;x-amz-date"
std::string signed_headers_list(const std::map<std::string, std::string>& signed_headers);

// Hex encoded request signature.
std::string get_signature(const signing_params& params);

// Complete "AWS4-HMAC-SHA256 Credential=..., SignedHeaders=..., Signature=..." value.
std::string authorization_header(const signing_params& params);

} // namespace utils::aws
