/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include <fmt/format.h>
#include <exception>
#include <map>
#include <memory>
#include <stdexcept>
#include <seastar/core/abort_source.hh>
#include <seastar/core/coroutine.hh>
#include <seastar/core/future.hh>
#include <seastar/core/iostream.hh>
#include <seastar/core/memory.hh>
#include <seastar/core/metrics.hh>
#include <seastar/core/temporary_buffer.hh>
#include <seastar/core/timed_out_error.hh>
#include <seastar/coroutine/exception.hh>
#include <seastar/coroutine/parallel_for_each.hh>
#include <seastar/http/exception.hh>
#include <seastar/http/request.hh>
#include <seastar/util/short_streams.hh>

#include "utils/aws_sigv4.hh"
#include "utils/exceptions.hh"
#include "utils/http.hh"
#include "utils/log.hh"
#include "utils/s3/aws_error.hh"
#include "utils/s3/client.hh"
#include "utils/s3/client_helpers/copy_s3_object.hh"
#include "utils/s3/utils/client_utils.hh"

using namespace std::chrono_literals;

namespace s3 {

future<> ignore_reply(const http::reply& rep, input_stream<char>&& in_) {
    auto in = std::move(in_);
    co_await util::skip_entire_stream(in);
}

client::client(endpoint_config_ptr cfg, private_tag)
        : _host(cfg->host)
        , _cfg(std::move(cfg)) {
    if (_host.empty()) {
        throw std::invalid_argument("S3 endpoint host is not configured");
    }
}

shared_ptr<client> client::make(endpoint_config_ptr cfg) {
    return seastar::make_shared<client>(std::move(cfg), private_tag{});
}

std::string client::host_header() const {
    if (_cfg->port == (_cfg->use_https ? 443u : 80u)) {
        return _host;
    }
    return fmt::format("{}:{}", _host, _cfg->port);
}

void client::authorize(http::request& req) {
    auto time_point_str = utils::aws::format_time_point(std::chrono::system_clock::now());
    req._headers["x-amz-date"] = time_point_str;
    req._headers["x-amz-content-sha256"] = sstring(utils::aws::unsigned_content);
    if (!_cfg->session_token.empty()) {
        req._headers["x-amz-security-token"] = _cfg->session_token;
    }
    std::map<std::string, std::string> signed_headers;
    // AWS requires all x-... and Host: headers to be signed
    signed_headers["host"] = std::string(req._headers["Host"]);
    for (const auto& [name, value] : req._headers) {
        if (name.starts_with("x-")) {
            signed_headers[std::string(name)] = std::string(value);
        }
    }
    std::map<std::string, std::string> query_parameters;
    for (const auto& q : req.query_parameters) {
        query_parameters[std::string(q.first)] = std::string(q.second);
    }
    auto query_string = utils::aws::canonical_query_string(query_parameters);
    utils::aws::signing_params params{
        .access_key_id = _cfg->access_key_id,
        .secret_access_key = _cfg->secret_access_key,
        .region = _cfg->region,
        .service = "s3",
        .amz_date = time_point_str,
        .method = req._method,
        .canonical_uri = req._url,
        .canonical_query = query_string,
        .signed_headers = signed_headers,
    };
    req._headers["Authorization"] = utils::aws::authorization_header(params);
}

client::group_client::group_client(std::unique_ptr<http::experimental::connection_factory> f, unsigned max_conn)
    : http(std::move(f), max_conn, http::experimental::client::retry_requests::yes) {
}

void client::group_client::register_metrics(std::string class_name, std::string host) {
    namespace sm = seastar::metrics;
    auto ep_label = sm::label("endpoint")(host);
    auto sg_label = sm::label("class")(class_name);
    metrics.add_group("s3", {
        sm::make_gauge("nr_connections", [this] { return http.connections_nr(); },
                sm::description("Total number of connections"), {ep_label, sg_label}),
        sm::make_gauge("nr_active_connections", [this] { return http.connections_nr() - http.idle_connections_nr(); },
                sm::description("Total number of connections with running requests"), {ep_label, sg_label}),
        sm::make_counter("total_new_connections", [this] { return http.total_new_connections_nr(); },
                sm::description("Total number of new connections created so far"), {ep_label, sg_label}),
        sm::make_counter("total_read_requests", [this] { return read_stats.ops; },
                sm::description("Total number of object read requests"), {ep_label, sg_label}),
        sm::make_counter("total_write_requests", [this] { return write_stats.ops; },
                sm::description("Total number of object write requests"), {ep_label, sg_label}),
        sm::make_counter("total_read_bytes", [this] { return read_stats.bytes; },
                sm::description("Total number of bytes read from objects"), {ep_label, sg_label}),
        sm::make_counter("total_write_bytes", [this] { return write_stats.bytes; },
                sm::description("Total number of bytes written to objects"), {ep_label, sg_label}),
        sm::make_counter("total_read_latency_sec", [this] { return read_stats.duration.count(); },
                sm::description("Total time spent reading data from objects"), {ep_label, sg_label}),
        sm::make_counter("total_write_latency_sec", [this] { return write_stats.duration.count(); },
                sm::description("Total time spend writing data to objects"), {ep_label, sg_label}),
    });
}

client::group_client& client::find_or_create_client() {
    auto sg = current_scheduling_group();
    auto it = _https.find(sg);
    if (it == _https.end()) [[unlikely]] {
        auto factory = std::make_unique<utils::http::dns_connection_factory>(_host, _cfg->port, _cfg->use_https, s3l);
        // Shares are typically in the range of 100...1000, thus resulting in 1..10 connections
        unsigned max_connections = _cfg->max_connections.has_value() ? *_cfg->max_connections : std::max((unsigned)(sg.get_shares() / 100), 1u);
        it = _https.emplace(std::piecewise_construct,
            std::forward_as_tuple(sg),
            std::forward_as_tuple(std::move(factory), max_connections)
        ).first;

        it->second.register_metrics(sg.name(), _host);
    }
    return it->second;
}

[[noreturn]] void map_s3_client_exception(std::exception_ptr ex) {
    seastar::memory::scoped_critical_alloc_section alloc;

    try {
        std::rethrow_exception(std::move(ex));
    } catch (const abort_requested_exception&) {
        throw;
    } catch (const std::invalid_argument&) {
        throw;
    } catch (const storage_io_error&) {
        throw;
    } catch (const aws::aws_exception& e) {
        int error_code;
        switch (e.error().get_error_type()) {
        case aws::aws_error_type::HTTP_NOT_FOUND:
        case aws::aws_error_type::NO_SUCH_BUCKET:
        case aws::aws_error_type::NO_SUCH_KEY:
        case aws::aws_error_type::NO_SUCH_UPLOAD:
            error_code = ENOENT;
            break;
        case aws::aws_error_type::HTTP_FORBIDDEN:
        case aws::aws_error_type::HTTP_UNAUTHORIZED:
        case aws::aws_error_type::ACCESS_DENIED:
        case aws::aws_error_type::INVALID_ACCESS_KEY_ID:
        case aws::aws_error_type::SIGNATURE_DOES_NOT_MATCH:
        case aws::aws_error_type::EXPIRED_TOKEN:
            error_code = EACCES;
            break;
        default:
            error_code = EIO;
        }
        throw storage_io_error{error_code, format("S3 request failed. Code: {}. Reason: {}", e.error().get_error_type(), e.what())};
    } catch (const httpd::unexpected_status_error& e) {
        auto status = e.status();

        if (http::reply::classify_status(status) == http::reply::status_class::redirection || status == http::reply::status_type::not_found) {
            throw storage_io_error {ENOENT, format("S3 object doesn't exist ({})", status)};
        }
        if (status == http::reply::status_type::forbidden || status == http::reply::status_type::unauthorized) {
            throw storage_io_error {EACCES, format("S3 access denied ({})", status)};
        }

        throw storage_io_error {EIO, format("S3 request failed with ({})", status)};
    } catch (const seastar::timed_out_error& e) {
        throw storage_io_error {ETIMEDOUT, format("S3 request timed out: {}", e.what())};
    } catch (...) {
        auto e = std::current_exception();
        if (is_timeout_exception(e)) {
            throw storage_io_error {ETIMEDOUT, format("S3 request timed out ({})", e)};
        }
        throw storage_io_error {EIO, format("S3 error ({})", e)};
    }
}

future<> client::make_request(http::request req, http::experimental::client::reply_handler handle, std::optional<http::reply::status_type> expected, abort_source* as) {
    // the http client does not check the abort status on entry
    if (as && as->abort_requested()) {
        co_await coroutine::return_exception_ptr(as->abort_requested_exception_ptr());
    }
    authorize(req);
    auto& gc = find_or_create_client();
    auto handler = [handle = std::move(handle), expected = expected.value_or(http::reply::status_type::ok)] (const http::reply& rep, input_stream<char>&& in) mutable -> future<> {
        auto payload = std::move(in);
        auto status_class = http::reply::classify_status(rep._status);

        if (status_class != http::reply::status_class::informational && status_class != http::reply::status_class::success) {
            std::optional<aws::aws_error> possible_error = aws::aws_error::parse(co_await util::read_entire_stream_contiguous(payload));
            if (possible_error) {
                possible_error->with_http_status(rep._status);
                co_await coroutine::return_exception(aws::aws_exception(std::move(*possible_error)));
            }
            co_await coroutine::return_exception(aws::aws_exception(aws::aws_error::from_http_code(rep._status)));
        }

        if (rep._status != expected) {
            co_await coroutine::return_exception(httpd::unexpected_status_error(rep._status));
        }
        co_await handle(rep, std::move(payload));
    };
    co_await (as ? gc.http.make_request(std::move(req), std::move(handler), *as, std::nullopt)
                 : gc.http.make_request(std::move(req), std::move(handler), std::nullopt));
}

future<> client::make_request(http::request req, reply_handler_ext handle_ex, std::optional<http::reply::status_type> expected, abort_source* as) {
    auto& gc = find_or_create_client();
    auto handle = [&gc, handle = std::move(handle_ex)] (const http::reply& rep, input_stream<char>&& in) {
        return handle(gc, rep, std::move(in));
    };
    co_await make_request(std::move(req), http::experimental::client::reply_handler(std::move(handle)), expected, as);
}

static sstring object_path(const sstring& object_name) {
    return sstring(utils::aws::uri_encode(object_name, false));
}

future<sstring> client::create_multipart_upload(sstring object_name, abort_source* as) {
    s3l.trace("POST uploads {}", object_name);
    auto req = http::request::make("POST", _host, object_path(object_name));
    req.query_parameters["uploads"] = "";
    sstring upload_id;
    co_await make_request(std::move(req), [&upload_id] (const http::reply& rep, input_stream<char>&& in_) -> future<> {
        auto in = std::move(in_);
        auto body = co_await util::read_entire_stream_contiguous(in);
        upload_id = parse_multipart_upload_id(body);
        if (upload_id.empty()) {
            co_await coroutine::return_exception(std::runtime_error("cannot initiate upload"));
        }
    }, http::reply::status_type::ok, as);
    s3l.trace("created uploads for {} -> id = {}", object_name, upload_id);
    co_return upload_id;
}

future<sstring> client::upload_part(sstring object_name, sstring upload_id, unsigned part_number, temporary_buffer<char> data, abort_source* as) {
    s3l.trace("PUT part {} of {} ({} bytes, upload id {})", part_number, object_name, data.size(), upload_id);
    auto req = http::request::make("PUT", _host, object_path(object_name));
    req.query_parameters["partNumber"] = to_sstring(part_number);
    req.query_parameters["uploadId"] = upload_id;
    auto len = data.size();
    req.write_body("bin", len, [buf = std::move(data)] (output_stream<char>&& out_) -> future<> {
        auto out = std::move(out_);
        std::exception_ptr ex;
        try {
            co_await out.write(buf.get(), buf.size());
            co_await out.flush();
        } catch (...) {
            ex = std::current_exception();
        }
        co_await out.close();
        if (ex) {
            co_await coroutine::return_exception_ptr(std::move(ex));
        }
    });
    sstring etag;
    co_await make_request(std::move(req), [&etag, len, start = s3_clock::now()] (group_client& gc, const http::reply& rep, input_stream<char>&& in) {
        etag = rep.get_header("ETag");
        if (etag.empty()) {
            return make_exception_future<>(std::runtime_error("cannot upload part: no ETag in reply"));
        }
        gc.write_stats.update(len, s3_clock::now() - start);
        return ignore_reply(rep, std::move(in));
    }, http::reply::status_type::ok, as);
    co_return etag;
}

future<> client::complete_multipart_upload(sstring object_name, sstring upload_id, std::vector<completed_part> parts, abort_source* as) {
    complete_multipart_upload_request request(std::move(parts));
    s3l.trace("POST upload completion {} parts of {} (upload id {})", request.parts().size(), object_name, upload_id);
    auto req = http::request::make("POST", _host, object_path(object_name));
    req.query_parameters["uploadId"] = upload_id;
    auto body = request.to_xml();
    auto body_size = body.size();
    req.write_body("xml", body_size, [body = std::move(body)] (output_stream<char>&& out) -> future<> {
        return write_body(std::move(out), std::move(body));
    });
    co_await make_request(std::move(req), [&object_name] (const http::reply& rep, input_stream<char>&& in_) -> future<> {
        auto in = std::move(in_);
        auto payload = co_await util::read_entire_stream_contiguous(in);
        // a 200 reply can still carry an <Error> document
        auto result = parse_complete_multipart_upload_result(payload);
        s3l.trace("completed {} -> etag {}", object_name, result.etag);
    }, http::reply::status_type::ok, as);
}

future<> client::abort_multipart_upload(sstring object_name, sstring upload_id, abort_source* as) {
    s3l.trace("DELETE upload {} of {}", upload_id, object_name);
    auto req = http::request::make("DELETE", _host, object_path(object_name));
    req.query_parameters["uploadId"] = upload_id;
    co_await make_request(std::move(req), ignore_reply, http::reply::status_type::no_content, as);
}

future<presigned_request> client::presign_upload_part(sstring object_name, sstring upload_id, unsigned part_number) {
    auto path = object_path(object_name);
    std::map<std::string, std::string> query{
        {"partNumber", fmt::to_string(part_number)},
        {"uploadId", std::string(upload_id)},
    };
    auto query_string = utils::aws::canonical_query_string(query);
    auto amz_date = utils::aws::format_time_point(std::chrono::system_clock::now());

    std::map<std::string, std::string> signed_headers{
        {"content-type", "application/octet-stream"},
        {"host", host_header()},
        {"x-amz-content-sha256", std::string(utils::aws::unsigned_content)},
        {"x-amz-date", amz_date},
    };
    if (!_cfg->session_token.empty()) {
        signed_headers["x-amz-security-token"] = _cfg->session_token;
    }
    utils::aws::signing_params params{
        .access_key_id = _cfg->access_key_id,
        .secret_access_key = _cfg->secret_access_key,
        .region = _cfg->region,
        .service = "s3",
        .amz_date = amz_date,
        .method = "PUT",
        .canonical_uri = path,
        .canonical_query = query_string,
        .signed_headers = signed_headers,
    };

    presigned_request ret;
    ret.method = "PUT";
    ret.url = fmt::format("{}://{}{}?{}", _cfg->use_https ? "https" : "http", host_header(), path, query_string);
    ret.headers["Content-Type"] = "application/octet-stream";
    ret.headers["x-amz-content-sha256"] = sstring(utils::aws::unsigned_content);
    ret.headers["x-amz-date"] = amz_date;
    if (!_cfg->session_token.empty()) {
        ret.headers["x-amz-security-token"] = _cfg->session_token;
    }
    ret.headers["Authorization"] = utils::aws::authorization_header(params);
    return make_ready_future<presigned_request>(std::move(ret));
}

future<> client::get_object_header(sstring object_name, http::experimental::client::reply_handler handler, abort_source* as) {
    s3l.trace("HEAD {}", object_name);
    auto req = http::request::make("HEAD", _host, object_path(object_name));
    return make_request(std::move(req), std::move(handler), http::reply::status_type::ok, as);
}

future<uint64_t> client::get_object_size(sstring object_name, abort_source* as) {
    uint64_t len = 0;
    co_await get_object_header(std::move(object_name), [&len] (const http::reply& rep, input_stream<char>&& in_) mutable -> future<> {
        len = rep.content_length;
        return make_ready_future<>(); // it's HEAD with no body
    }, as);
    co_return len;
}

future<temporary_buffer<char>> client::get_object_contiguous(sstring object_name, std::optional<range> range, abort_source* as) {
    auto req = http::request::make("GET", _host, object_path(object_name));
    http::reply::status_type expected = http::reply::status_type::ok;
    if (range) {
        if (range->len == 0) {
            co_return temporary_buffer<char>();
        }
        auto end_bytes = range->off + range->len - 1;
        if (end_bytes < range->off) {
            throw std::overflow_error("End of the range exceeds 64-bits");
        }
        auto range_header = format("bytes={}-{}", range->off, end_bytes);
        s3l.trace("GET {} contiguous range='{}'", object_name, range_header);
        req._headers["Range"] = std::move(range_header);
        expected = http::reply::status_type::partial_content;
    } else {
        s3l.trace("GET {} contiguous", object_name);
    }

    size_t off = 0;
    std::optional<temporary_buffer<char>> ret;
    co_await make_request(std::move(req), [&off, &ret, &object_name, start = s3_clock::now()] (group_client& gc, const http::reply& rep, input_stream<char>&& in_) mutable -> future<> {
        auto in = std::move(in_);
        ret = temporary_buffer<char>(rep.content_length);
        off = 0;
        s3l.trace("Consume {} bytes for {}", ret->size(), object_name);
        co_await in.consume([&off, &ret] (temporary_buffer<char> buf) mutable {
            if (buf.empty()) {
                return make_ready_future<consumption_result<char>>(stop_consuming(std::move(buf)));
            }

            size_t to_copy = std::min(ret->size() - off, buf.size());
            if (to_copy > 0) {
                std::copy_n(buf.get(), to_copy, ret->get_write() + off);
                off += to_copy;
            }
            return make_ready_future<consumption_result<char>>(continue_consuming());
        });
        gc.read_stats.update(off, s3_clock::now() - start);
    }, expected, as);
    ret->trim(off);
    s3l.trace("Consumed {} bytes of {}", off, object_name);
    co_return std::move(*ret);
}

future<> client::put_object(sstring object_name, temporary_buffer<char> buf, abort_source* as) {
    s3l.trace("PUT {}", object_name);
    auto req = http::request::make("PUT", _host, object_path(object_name));
    auto len = buf.size();
    req.write_body("bin", len, [buf = std::move(buf)] (output_stream<char>&& out_) -> future<> {
        auto out = std::move(out_);
        std::exception_ptr ex;
        try {
            co_await out.write(buf.get(), buf.size());
            co_await out.flush();
        } catch (...) {
            ex = std::current_exception();
        }
        co_await out.close();
        if (ex) {
            co_await coroutine::return_exception_ptr(std::move(ex));
        }
    });
    co_await make_request(std::move(req), [len, start = s3_clock::now()] (group_client& gc, const auto& rep, auto&& in) {
        gc.write_stats.update(len, s3_clock::now() - start);
        return ignore_reply(rep, std::move(in));
    }, http::reply::status_type::ok, as);
}

future<> client::delete_object(sstring object_name, abort_source* as) {
    s3l.trace("DELETE {}", object_name);
    auto req = http::request::make("DELETE", _host, object_path(object_name));
    co_await make_request(std::move(req), ignore_reply, http::reply::status_type::no_content, as);
}

future<> client::copy_object(sstring source_object, sstring target_object, abort_source* as) {
    co_await copy_s3_object(shared_from_this(), std::move(source_object), std::move(target_object), as).copy();
}

future<> client::close() {
    co_await coroutine::parallel_for_each(_https, [] (auto& it) -> future<> {
        co_await it.second.http.close();
    });
}

} // s3 namespace
