/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#if __has_include(<rapidxml.h>)
#include <rapidxml.h>
#else
#include <rapidxml/rapidxml.hpp>
#endif

#include <memory>
#include <seastar/core/abort_source.hh>
#include <seastar/core/timed_out_error.hh>
#include <seastar/http/exception.hh>

#include "aws_error.hh"

namespace aws {

aws_error::aws_error(aws_error_type error_type, retryable is_retryable) : _type(error_type), _is_retryable(is_retryable) {
}

aws_error::aws_error(aws_error_type error_type, std::string error_message, retryable is_retryable)
    : _type(error_type), _message(std::move(error_message)), _is_retryable(is_retryable) {
}

aws_error& aws_error::with_http_status(seastar::http::reply::status_type status) {
    _http_status = status;
    // A status the retry policy considers transient wins over a code the
    // error map does not know about.
    if (utils::http::from_http_code(status)) {
        _is_retryable = retryable::yes;
    }
    return *this;
}

std::optional<aws_error> aws_error::parse(seastar::sstring body) {
    if (body.empty()) {
        return {};
    }

    auto doc = std::make_unique<rapidxml::xml_document<>>();
    try {
        doc->parse<0>(body.data());
    } catch (const rapidxml::parse_error&) {
        // Most likely not an XML which is possible, just return
        return {};
    }

    const auto* error_node = doc->first_node("Error");
    if (!error_node && doc->first_node("ErrorResponse")) {
        error_node = doc->first_node("ErrorResponse")->first_node("Error");
    }
    if (!error_node) {
        return {};
    }

    const auto* code_node = error_node->first_node("Code");
    const auto* message_node = error_node->first_node("Message");
    if (!code_node) {
        return {};
    }

    std::string code = code_node->value();
    std::string message = message_node ? message_node->value() : "";
    aws_error ret;
    if (auto it = aws_error_map.find(code); it != aws_error_map.end()) {
        ret = it->second;
    } else {
        ret._type = aws_error_type::UNKNOWN;
        ret._is_retryable = retryable::no;
    }
    ret._message = fmt::format("{}: {}", code, message);
    return ret;
}

aws_error aws_error::from_http_code(seastar::http::reply::status_type http_code) {
    auto retry = utils::http::from_http_code(http_code);
    aws_error ret;
    switch (static_cast<int>(http_code)) {
    case 400:
        ret = aws_error(aws_error_type::HTTP_BAD_REQUEST, "Bad request", retry);
        break;
    case 401:
        ret = aws_error(aws_error_type::HTTP_UNAUTHORIZED, "Unauthorized", retry);
        break;
    case 403:
        ret = aws_error(aws_error_type::HTTP_FORBIDDEN, "Forbidden", retry);
        break;
    case 404:
        ret = aws_error(aws_error_type::HTTP_NOT_FOUND, "Not found", retry);
        break;
    case 408:
        ret = aws_error(aws_error_type::HTTP_REQUEST_TIMEOUT, "Request timeout", retry);
        break;
    case 429:
        ret = aws_error(aws_error_type::HTTP_TOO_MANY_REQUESTS, "Too many requests", retry);
        break;
    case 500:
        ret = aws_error(aws_error_type::HTTP_INTERNAL_SERVER_ERROR, "Internal server error", retry);
        break;
    case 502:
        ret = aws_error(aws_error_type::HTTP_BAD_GATEWAY, "Bad gateway", retry);
        break;
    case 503:
        ret = aws_error(aws_error_type::HTTP_SERVICE_UNAVAILABLE, "Service unavailable", retry);
        break;
    case 504:
        ret = aws_error(aws_error_type::HTTP_GATEWAY_TIMEOUT, "Gateway timeout", retry);
        break;
    case 599:
        ret = aws_error(aws_error_type::HTTP_NETWORK_CONNECT_TIMEOUT, "Network connect timeout", retry);
        break;
    default:
        ret = aws_error(aws_error_type::UNKNOWN, fmt::format("Unexpected HTTP status {}", static_cast<int>(http_code)), retry);
        break;
    }
    ret._http_status = http_code;
    return ret;
}

const aws_errors aws_error_map{
    {"AccessDenied", aws_error(aws_error_type::ACCESS_DENIED, retryable::no)},
    {"EntityTooSmall", aws_error(aws_error_type::ENTITY_TOO_SMALL, retryable::no)},
    {"EntityTooLarge", aws_error(aws_error_type::ENTITY_TOO_LARGE, retryable::no)},
    {"InternalError", aws_error(aws_error_type::INTERNAL_ERROR, retryable::yes)},
    {"InvalidAccessKeyId", aws_error(aws_error_type::INVALID_ACCESS_KEY_ID, retryable::no)},
    {"InvalidArgument", aws_error(aws_error_type::INVALID_ARGUMENT, retryable::no)},
    {"InvalidAction", aws_error(aws_error_type::INVALID_REQUEST, retryable::no)},
    {"InvalidPart", aws_error(aws_error_type::INVALID_PART, retryable::no)},
    {"InvalidPartOrder", aws_error(aws_error_type::INVALID_PART_ORDER, retryable::no)},
    {"InvalidRequest", aws_error(aws_error_type::INVALID_REQUEST, retryable::no)},
    {"NoSuchBucket", aws_error(aws_error_type::NO_SUCH_BUCKET, retryable::no)},
    {"NoSuchKey", aws_error(aws_error_type::NO_SUCH_KEY, retryable::no)},
    {"NoSuchUpload", aws_error(aws_error_type::NO_SUCH_UPLOAD, retryable::no)},
    {"RequestTimeTooSkewed", aws_error(aws_error_type::REQUEST_TIME_TOO_SKEWED, retryable::yes)},
    {"RequestTimeout", aws_error(aws_error_type::REQUEST_TIMEOUT, retryable::yes)},
    {"ServiceUnavailable", aws_error(aws_error_type::SERVICE_UNAVAILABLE, retryable::yes)},
    {"SignatureDoesNotMatch", aws_error(aws_error_type::SIGNATURE_DOES_NOT_MATCH, retryable::no)},
    {"SlowDown", aws_error(aws_error_type::SLOW_DOWN, retryable::yes)},
    {"Throttling", aws_error(aws_error_type::THROTTLING, retryable::yes)},
    {"ThrottlingException", aws_error(aws_error_type::THROTTLING, retryable::yes)},
    {"ExpiredToken", aws_error(aws_error_type::EXPIRED_TOKEN, retryable::no)},
};

retryable is_retryable(std::exception_ptr error) {
    return utils::http::dispatch_exception<retryable>(
        std::move(error),
        [] (std::exception_ptr, std::string&& original_message) {
            return utils::http::from_message(original_message);
        },
        utils::http::make_handler<seastar::abort_requested_exception>([] (const seastar::abort_requested_exception&) {
            return retryable::no;
        }),
        utils::http::make_handler<aws_exception>([] (const aws_exception& ex) {
            return ex.error().is_retryable();
        }),
        utils::http::make_handler<seastar::httpd::unexpected_status_error>([] (const seastar::httpd::unexpected_status_error& ex) {
            return utils::http::from_http_code(ex.status());
        }),
        utils::http::make_handler<seastar::timed_out_error>([] (const seastar::timed_out_error&) {
            return retryable::yes;
        }),
        utils::http::make_handler<std::system_error>([] (const std::system_error& ex) {
            return utils::http::from_system_error(ex);
        }));
}

} // namespace aws

auto fmt::formatter<aws::aws_error_type>::format(const aws::aws_error_type& error_type, fmt::format_context& ctx) const -> decltype(ctx.out()) {
    using enum aws::aws_error_type;
    std::string_view name;
    switch (error_type) {
    case OK: name = "OK"; break;
    case HTTP_REQUEST_TIMEOUT: name = "HTTP_REQUEST_TIMEOUT"; break;
    case HTTP_TOO_MANY_REQUESTS: name = "HTTP_TOO_MANY_REQUESTS"; break;
    case HTTP_BAD_REQUEST: name = "HTTP_BAD_REQUEST"; break;
    case HTTP_UNAUTHORIZED: name = "HTTP_UNAUTHORIZED"; break;
    case HTTP_FORBIDDEN: name = "HTTP_FORBIDDEN"; break;
    case HTTP_NOT_FOUND: name = "HTTP_NOT_FOUND"; break;
    case HTTP_INTERNAL_SERVER_ERROR: name = "HTTP_INTERNAL_SERVER_ERROR"; break;
    case HTTP_BAD_GATEWAY: name = "HTTP_BAD_GATEWAY"; break;
    case HTTP_SERVICE_UNAVAILABLE: name = "HTTP_SERVICE_UNAVAILABLE"; break;
    case HTTP_GATEWAY_TIMEOUT: name = "HTTP_GATEWAY_TIMEOUT"; break;
    case HTTP_NETWORK_CONNECT_TIMEOUT: name = "HTTP_NETWORK_CONNECT_TIMEOUT"; break;
    case ACCESS_DENIED: name = "ACCESS_DENIED"; break;
    case ENTITY_TOO_SMALL: name = "ENTITY_TOO_SMALL"; break;
    case ENTITY_TOO_LARGE: name = "ENTITY_TOO_LARGE"; break;
    case INTERNAL_ERROR: name = "INTERNAL_ERROR"; break;
    case INVALID_ACCESS_KEY_ID: name = "INVALID_ACCESS_KEY_ID"; break;
    case INVALID_ARGUMENT: name = "INVALID_ARGUMENT"; break;
    case INVALID_PART: name = "INVALID_PART"; break;
    case INVALID_PART_ORDER: name = "INVALID_PART_ORDER"; break;
    case INVALID_REQUEST: name = "INVALID_REQUEST"; break;
    case NO_SUCH_BUCKET: name = "NO_SUCH_BUCKET"; break;
    case NO_SUCH_KEY: name = "NO_SUCH_KEY"; break;
    case NO_SUCH_UPLOAD: name = "NO_SUCH_UPLOAD"; break;
    case REQUEST_TIME_TOO_SKEWED: name = "REQUEST_TIME_TOO_SKEWED"; break;
    case REQUEST_TIMEOUT: name = "REQUEST_TIMEOUT"; break;
    case SERVICE_UNAVAILABLE: name = "SERVICE_UNAVAILABLE"; break;
    case SIGNATURE_DOES_NOT_MATCH: name = "SIGNATURE_DOES_NOT_MATCH"; break;
    case SLOW_DOWN: name = "SLOW_DOWN"; break;
    case THROTTLING: name = "THROTTLING"; break;
    case EXPIRED_TOKEN: name = "EXPIRED_TOKEN"; break;
    case UNKNOWN: name = "UNKNOWN"; break;
    }
    return fmt::formatter<std::string_view>::format(name, ctx);
}
