/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "http_client_error_processing.hh"

#include <algorithm>
#include <array>
#include <cctype>
#include <cerrno>

namespace utils::http {

retryable from_http_code(seastar::http::reply::status_type http_code) {
    switch (static_cast<int>(http_code)) {
    case 408: // request timeout
    case 429: // too many requests
    case 500:
    case 502:
    case 503:
    case 504:
    case 599: // network connect timeout reported by gateways
        return retryable::yes;
    default:
        return retryable::no;
    }
}

retryable from_system_error(const std::system_error& system_error) {
    switch (system_error.code().value()) {
    case ECONNRESET:
    case ECONNREFUSED:
    case ECONNABORTED:
    case ETIMEDOUT:
    case EPIPE:
    case ENETUNREACH:
    case EHOSTUNREACH:
    case ENETDOWN:
        return retryable::yes;
    default:
        return from_message(system_error.what());
    }
}

static constexpr std::array<std::string_view, 21> retryable_patterns = {
    "network",
    "timeout",
    "timed out",
    "econnreset",
    "etimedout",
    "connection lost",
    "connection closed",
    "connection reset",
    "connection refused",
    "socket hang up",
    "enotfound",
    "econnrefused",
    "fetch failed",
    "failed to fetch",
    "network request failed",
    "aborted",
    "request aborted",
    "protocol error",
    "err_http2",
    "broken pipe",
    "name resolution",
};

retryable from_message(std::string_view message) {
    std::string lower(message);
    std::ranges::transform(lower, lower.begin(), [] (unsigned char c) { return std::tolower(c); });
    for (auto pattern : retryable_patterns) {
        if (lower.find(pattern) != std::string::npos) {
            return retryable::yes;
        }
    }
    return retryable::no;
}

} // namespace utils::http
