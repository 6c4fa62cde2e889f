/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <exception>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <fmt/format.h>
#include <seastar/core/sstring.hh>
#include <seastar/http/reply.hh>

#include "utils/http_client_error_processing.hh"

namespace aws {

using utils::http::retryable;

enum class aws_error_type : uint8_t {
    OK,
    // HTTP level errors without an AWS error document
    HTTP_REQUEST_TIMEOUT,
    HTTP_TOO_MANY_REQUESTS,
    HTTP_BAD_REQUEST,
    HTTP_UNAUTHORIZED,
    HTTP_FORBIDDEN,
    HTTP_NOT_FOUND,
    HTTP_INTERNAL_SERVER_ERROR,
    HTTP_BAD_GATEWAY,
    HTTP_SERVICE_UNAVAILABLE,
    HTTP_GATEWAY_TIMEOUT,
    HTTP_NETWORK_CONNECT_TIMEOUT,
    // S3 error codes
    ACCESS_DENIED,
    ENTITY_TOO_SMALL,
    ENTITY_TOO_LARGE,
    INTERNAL_ERROR,
    INVALID_ACCESS_KEY_ID,
    INVALID_ARGUMENT,
    INVALID_PART,
    INVALID_PART_ORDER,
    INVALID_REQUEST,
    NO_SUCH_BUCKET,
    NO_SUCH_KEY,
    NO_SUCH_UPLOAD,
    REQUEST_TIME_TOO_SKEWED,
    REQUEST_TIMEOUT,
    SERVICE_UNAVAILABLE,
    SIGNATURE_DOES_NOT_MATCH,
    SLOW_DOWN,
    THROTTLING,
    EXPIRED_TOKEN,
    UNKNOWN,
};

class aws_error {
    aws_error_type _type{aws_error_type::OK};
    std::string _message;
    retryable _is_retryable{retryable::no};
    std::optional<seastar::http::reply::status_type> _http_status;

public:
    aws_error() = default;
    aws_error(aws_error_type error_type, retryable is_retryable);
    aws_error(aws_error_type error_type, std::string error_message, retryable is_retryable);

    [[nodiscard]] const std::string& get_error_message() const { return _message; }
    [[nodiscard]] aws_error_type get_error_type() const { return _type; }
    [[nodiscard]] retryable is_retryable() const { return _is_retryable; }
    [[nodiscard]] std::optional<seastar::http::reply::status_type> http_status() const { return _http_status; }

    aws_error& with_http_status(seastar::http::reply::status_type status);

    // Parses an S3 <Error> document. Returns nullopt when the body is not one.
    static std::optional<aws_error> parse(seastar::sstring body);
    static aws_error from_http_code(seastar::http::reply::status_type http_code);
};

using aws_errors = std::unordered_map<std::string_view, const aws_error>;
extern const aws_errors aws_error_map;

class aws_exception : public std::exception {
    aws_error _error;

public:
    explicit aws_exception(const aws_error& error) noexcept : _error(error) {}
    explicit aws_exception(aws_error&& error) noexcept : _error(std::move(error)) {}

    const char* what() const noexcept override { return _error.get_error_message().c_str(); }
    const aws_error& error() const noexcept { return _error; }
};

// Decides whether a failed storage call may be attempted again. Walks nested
// exceptions; caller aborts are never retryable.
retryable is_retryable(std::exception_ptr error);

} // namespace aws

template <>
struct fmt::formatter<aws::aws_error_type> : fmt::formatter<std::string_view> {
    auto format(const aws::aws_error_type& error_type, fmt::format_context& ctx) const -> decltype(ctx.out());
};
