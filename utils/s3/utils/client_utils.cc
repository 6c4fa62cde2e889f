/*
 * Copyright (C) 2025-present ScyllaDB
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
#include <stdexcept>
#include <string>
#include <fmt/format.h>
#include <seastar/core/coroutine.hh>
#include <seastar/coroutine/exception.hh>

#include "client_utils.hh"
#include "utils/log.hh"
#include "utils/s3/aws_error.hh"

static constexpr std::string_view multipart_upload_complete_header = "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\r\n"
                                                                     "<CompleteMultipartUpload xmlns=\"http://s3.amazonaws.com/doc/2006-03-01/\">";

static constexpr std::string_view multipart_upload_complete_trailer = "</CompleteMultipartUpload>";

namespace s3 {

using namespace seastar;
logging::logger s3l("s3");

complete_multipart_upload_request::complete_multipart_upload_request(std::vector<completed_part> parts)
    : _parts(std::move(parts)) {
    if (_parts.empty()) {
        throw std::invalid_argument("multipart upload cannot be completed without parts");
    }
    unsigned previous = 0;
    for (const auto& p : _parts) {
        if (p.part_number <= previous || p.part_number > aws_maximum_parts_in_piece) {
            throw std::invalid_argument(fmt::format("part {} is out of order or out of range (previous {})", p.part_number, previous));
        }
        if (p.etag.empty()) {
            throw std::invalid_argument(fmt::format("part {} has no ETag", p.part_number));
        }
        previous = p.part_number;
    }
}

sstring complete_multipart_upload_request::to_xml() const {
    fmt::memory_buffer body;
    fmt::format_to(fmt::appender(body), "{}", multipart_upload_complete_header);
    for (const auto& p : _parts) {
        fmt::format_to(fmt::appender(body), "<Part><PartNumber>{}</PartNumber><ETag>{}</ETag></Part>", p.part_number, xml_escape(p.etag));
    }
    fmt::format_to(fmt::appender(body), "{}", multipart_upload_complete_trailer);
    return sstring(body.data(), body.size());
}

sstring xml_escape(std::string_view text) {
    std::string ret;
    ret.reserve(text.size());
    for (char c : text) {
        switch (c) {
        case '&': ret += "&amp;"; break;
        case '<': ret += "&lt;"; break;
        case '>': ret += "&gt;"; break;
        case '"': ret += "&quot;"; break;
        case '\'': ret += "&apos;"; break;
        default: ret += c; break;
        }
    }
    return sstring(ret);
}

sstring parse_multipart_upload_id(sstring& body) {
    auto doc = std::make_unique<rapidxml::xml_document<>>();
    try {
        doc->parse<0>(body.data());
    } catch (const rapidxml::parse_error& e) {
        s3l.warn("cannot parse initiate multipart upload response: {}", e.what());
        // The caller is supposed to check the upload-id to be empty
        // and handle the error the way it prefers
        return "";
    }
    auto root_node = doc->first_node("InitiateMultipartUploadResult");
    if (!root_node) {
        return "";
    }
    auto uploadid_node = root_node->first_node("UploadId");
    return uploadid_node ? uploadid_node->value() : "";
}

complete_multipart_upload_result parse_complete_multipart_upload_result(sstring& body) {
    complete_multipart_upload_result ret;
    if (body.empty()) {
        return ret;
    }
    if (auto error = aws::aws_error::parse(body)) {
        throw aws::aws_exception(std::move(*error));
    }
    auto doc = std::make_unique<rapidxml::xml_document<>>();
    try {
        doc->parse<0>(body.data());
    } catch (const rapidxml::parse_error& e) {
        s3l.warn("cannot parse complete multipart upload response: {}", e.what());
        return ret;
    }
    auto root_node = doc->first_node("CompleteMultipartUploadResult");
    if (!root_node) {
        return ret;
    }
    auto text_of = [root_node] (const char* name) -> sstring {
        auto node = root_node->first_node(name);
        return node ? node->value() : "";
    };
    ret.location = text_of("Location");
    ret.bucket = text_of("Bucket");
    ret.key = text_of("Key");
    ret.etag = text_of("ETag");
    return ret;
}

future<> write_body(output_stream<char> out, sstring body) {
    std::exception_ptr ex;
    try {
        co_await out.write(body.data(), body.size());
        co_await out.flush();
    } catch (...) {
        ex = std::current_exception();
    }
    co_await out.close();
    if (ex) {
        co_await coroutine::return_exception_ptr(std::move(ex));
    }
}

sstring parse_multipart_copy_upload_etag(sstring& body) {
    auto doc = std::make_unique<rapidxml::xml_document<>>();
    try {
        doc->parse<0>(body.data());
    } catch (const rapidxml::parse_error& e) {
        s3l.warn("cannot parse multipart copy upload response: {}", e.what());
        // The caller is supposed to check the etag to be empty
        // and handle the error the way it prefers
        return "";
    }
    auto root_node = doc->first_node("CopyPartResult");
    if (!root_node) {
        return "";
    }
    auto etag_node = root_node->first_node("ETag");
    return etag_node ? etag_node->value() : "";
}

} // namespace s3
