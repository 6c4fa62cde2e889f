/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include <array>
#include <ctime>
#include <stdexcept>
#include <fmt/format.h>
#include <gnutls/crypto.h>
#include <gnutls/gnutls.h>

#include "utils/aws_sigv4.hh"

namespace utils::aws {

using hmac_sha256_digest = std::array<char, 32>;

static hmac_sha256_digest hmac_sha256(std::string_view key, std::string_view msg) {
    hmac_sha256_digest digest;
    int ret = gnutls_hmac_fast(GNUTLS_MAC_SHA256, key.data(), key.size(), msg.data(), msg.size(), digest.data());
    if (ret) {
        throw std::runtime_error(fmt::format("Computing HMAC failed ({}): {}", ret, gnutls_strerror(ret)));
    }
    return digest;
}

static std::string to_hex(std::string_view data) {
    static constexpr char digits[] = "0123456789abcdef";
    std::string ret;
    ret.reserve(data.size() * 2);
    for (unsigned char c : data) {
        ret.push_back(digits[c >> 4]);
        ret.push_back(digits[c & 0xf]);
    }
    return ret;
}

static std::string_view as_view(const hmac_sha256_digest& d) {
    return std::string_view(d.data(), d.size());
}

std::string sha256_hex(std::string_view data) {
    std::array<char, 32> digest;
    int ret = gnutls_hash_fast(GNUTLS_DIG_SHA256, data.data(), data.size(), digest.data());
    if (ret) {
        throw std::runtime_error(fmt::format("Computing SHA256 failed ({}): {}", ret, gnutls_strerror(ret)));
    }
    return to_hex(std::string_view(digest.data(), digest.size()));
}

std::string format_time_point(std::chrono::system_clock::time_point tp) {
    std::time_t time_point_repr = std::chrono::system_clock::to_time_t(tp);
    std::tm tm_buf;
    ::gmtime_r(&time_point_repr, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y%m%dT%H%M%SZ", &tm_buf);
    return buf;
}

std::string uri_encode(std::string_view value, bool encode_slash) {
    static constexpr char digits[] = "0123456789ABCDEF";
    std::string ret;
    ret.reserve(value.size());
    for (unsigned char c : value) {
        if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9')
                || c == '-' || c == '_' || c == '.' || c == '~' || (c == '/' && !encode_slash)) {
            ret.push_back(c);
        } else {
            ret.push_back('%');
            ret.push_back(digits[c >> 4]);
            ret.push_back(digits[c & 0xf]);
        }
    }
    return ret;
}

std::string canonical_query_string(const std::map<std::string, std::string>& query_parameters) {
    std::string ret;
    for (const auto& [name, value] : query_parameters) {
        if (!ret.empty()) {
            ret += '&';
        }
        ret += uri_encode(name);
        ret += '=';
        ret += uri_encode(value);
    }
    return ret;
}

std::string signed_headers_list(const std::map<std::string, std::string>& signed_headers) {
    std::string ret;
    for (const auto& h : signed_headers) {
        if (!ret.empty()) {
            ret += ';';
        }
        ret += h.first;
    }
    return ret;
}

std::string get_signature(const signing_params& p) {
    if (p.amz_date.size() < 8) {
        throw std::invalid_argument(fmt::format("Malformed signing date {}", p.amz_date));
    }
    auto datestamp = p.amz_date.substr(0, 8);

    std::string canonical_headers;
    for (const auto& [name, value] : p.signed_headers) {
        canonical_headers += fmt::format("{}:{}\n", name, value);
    }
    auto canonical_request = fmt::format("{}\n{}\n{}\n{}\n{}\n{}",
            p.method, p.canonical_uri, p.canonical_query, canonical_headers, signed_headers_list(p.signed_headers), p.payload_hash);

    auto scope = fmt::format("{}/{}/{}/aws4_request", datestamp, p.region, p.service);
    auto string_to_sign = fmt::format("AWS4-HMAC-SHA256\n{}\n{}\n{}", p.amz_date, scope, sha256_hex(canonical_request));

    auto k_date = hmac_sha256(fmt::format("AWS4{}", p.secret_access_key), datestamp);
    auto k_region = hmac_sha256(as_view(k_date), p.region);
    auto k_service = hmac_sha256(as_view(k_region), p.service);
    auto k_signing = hmac_sha256(as_view(k_service), "aws4_request");
    return to_hex(as_view(hmac_sha256(as_view(k_signing), string_to_sign)));
}

std::string authorization_header(const signing_params& p) {
    return fmt::format("AWS4-HMAC-SHA256 Credential={}/{}/{}/{}/aws4_request,SignedHeaders={},Signature={}",
            p.access_key_id, p.amz_date.substr(0, 8), p.region, p.service, signed_headers_list(p.signed_headers), get_signature(p));
}

} // namespace utils::aws
