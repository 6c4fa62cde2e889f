/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include <seastar/core/coroutine.hh>
#include <seastar/coroutine/exception.hh>
#include <seastar/http/reply.hh>
#include <seastar/http/request.hh>
#include <seastar/util/short_streams.hh>

#include "client/http_part_transport.hh"
#include "utils/http.hh"
#include "utils/log.hh"
#include "utils/s3/aws_error.hh"

namespace client {

static logging::logger transportl("http");

static uint16_t default_port(const std::string& scheme) {
    return scheme == "https" ? 443 : 80;
}

http_part_transport::http_part_transport(unsigned max_connections)
    : _max_connections(max_connections)
{}

http::experimental::client& http_part_transport::client_for(const std::string& scheme, const std::string& host, uint16_t port) {
    auto origin = fmt::format("{}://{}:{}", scheme, host, port);
    auto it = _clients.find(origin);
    if (it == _clients.end()) [[unlikely]] {
        auto factory = std::make_unique<utils::http::dns_connection_factory>(host, port, scheme == "https", transportl);
        auto cln = std::make_unique<http::experimental::client>(std::move(factory), _max_connections, http::experimental::client::retry_requests::yes);
        it = _clients.emplace(std::move(origin), std::move(cln)).first;
    }
    return *it->second;
}

future<sstring> http_part_transport::put_part(const ingest::part_descriptor& part, temporary_buffer<char> data, abort_source* as) {
    if (as && as->abort_requested()) {
        co_await coroutine::return_exception_ptr(as->abort_requested_exception_ptr());
    }
    auto url = utils::http::parse_simple_url(part.url);
    auto host = url.port == default_port(url.scheme) ? url.host : fmt::format("{}:{}", url.host, url.port);
    // the query was signed as is, keep it in the target
    auto req = http::request::make("PUT", sstring(host), sstring(url.path.empty() ? "/" : url.path));
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
    for (const auto& [name, value] : part.headers) {
        req._headers[name] = value;
    }

    transportl.trace("PUT part {} ({} bytes) to {}", part.part_number, len, url.host);
    sstring etag;
    auto handler = [&etag] (const http::reply& rep, input_stream<char>&& in_) -> future<> {
        auto in = std::move(in_);
        auto body = co_await util::read_entire_stream_contiguous(in);
        if (http::reply::classify_status(rep._status) != http::reply::status_class::success) {
            auto error = aws::aws_error::parse(body);
            if (error) {
                error->with_http_status(rep._status);
                co_await coroutine::return_exception(aws::aws_exception(std::move(*error)));
            }
            co_await coroutine::return_exception(aws::aws_exception(aws::aws_error::from_http_code(rep._status)));
        }
        etag = rep.get_header("ETag");
        if (etag.empty()) {
            co_await coroutine::return_exception(std::runtime_error("part upload reply carries no ETag"));
        }
    };
    auto& cln = client_for(url.scheme, url.host, url.port);
    co_await (as ? cln.make_request(std::move(req), std::move(handler), *as, std::nullopt)
                 : cln.make_request(std::move(req), std::move(handler), std::nullopt));
    co_return etag;
}

future<> http_part_transport::close() {
    for (auto& [origin, cln] : _clients) {
        co_await cln->close();
    }
    _clients.clear();
}

} // namespace client
