/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include <limits>
#include <seastar/core/coroutine.hh>
#include <seastar/http/function_handlers.hh>
#include <seastar/net/inet_address.hh>

#include "api/upload_handlers.hh"
#include "archive/archive_builder.hh"
#include "ingest/exceptions.hh"
#include "utils/exceptions.hh"
#include "utils/log.hh"
#include "utils/rjson.hh"

namespace api {

static logging::logger apil("api");

using reply = http::reply;
using request = http::request;

void generate_error_reply(reply& rep, std::exception_ptr ex) {
    rjson::value body = rjson::empty_object();
    auto status = reply::status_type::internal_server_error;
    try {
        std::rethrow_exception(ex);
    } catch (const ingest::session_not_found& e) {
        status = reply::status_type::not_found;
        rjson::add(body, "error", std::string_view(e.what()));
    } catch (const ingest::incomplete_upload_error& e) {
        status = reply::status_type::conflict;
        rjson::add(body, "error", std::string_view(e.what()));
        rjson::value missing = rjson::empty_object();
        for (const auto& [file, indices] : e.missing()) {
            rjson::value arr = rjson::empty_array();
            for (auto idx : indices) {
                rjson::push_back(arr, rjson::value(idx));
            }
            rjson::add_with_string_name(missing, file, std::move(arr));
        }
        rjson::add(body, "missing", std::move(missing));
    } catch (const ingest::remote_inconsistency_error& e) {
        status = reply::status_type::conflict;
        rjson::add(body, "error", std::string_view(e.what()));
    } catch (const std::invalid_argument& e) {
        status = reply::status_type::bad_request;
        rjson::add(body, "error", std::string_view(e.what()));
    } catch (const rjson::error& e) {
        status = reply::status_type::bad_request;
        rjson::add(body, "error", std::string_view(e.what()));
    } catch (const archive::builder_failure_error& e) {
        rjson::add(body, "error", std::string_view(e.what()));
    } catch (const storage_io_error& e) {
        status = reply::status_type::bad_gateway;
        rjson::add(body, "error", std::string_view(e.what()));
    } catch (...) {
        apil.error("Unexpected error: {}", std::current_exception());
        rjson::add(body, "error", std::string_view("internal server error"));
    }
    rep.set_status(status);
    rep.write_body("json", sstring(rjson::print(body)));
}

static unsigned get_unsigned(const rjson::value& v, rjson::string_ref_type name) {
    auto n = rjson::get_uint64(v, name);
    if (n > std::numeric_limits<unsigned>::max()) {
        throw rjson::error(fmt::format("{} is out of range: {}", name.s, n));
    }
    return unsigned(n);
}

static rjson::value to_json(const ingest::session_descriptor& desc) {
    rjson::value ret = rjson::empty_object();
    rjson::add(ret, "sessionId", std::string_view(desc.session_id));
    rjson::add(ret, "chunkSize", rjson::value(desc.chunk_size));
    rjson::value files = rjson::empty_array();
    for (const auto& f : desc.files) {
        rjson::value file = rjson::empty_object();
        rjson::add(file, "name", std::string_view(f.name));
        rjson::add(file, "totalChunks", rjson::value(f.total_chunks));
        rjson::add(file, "uploadId", std::string_view(f.multipart_id));
        rjson::value parts = rjson::empty_array();
        for (const auto& p : f.parts) {
            rjson::value part = rjson::empty_object();
            rjson::add(part, "partNumber", rjson::value(p.part_number));
            rjson::add(part, "uploadUrl", std::string_view(p.url));
            rjson::value headers = rjson::empty_object();
            for (const auto& [name, value] : p.headers) {
                rjson::add_with_string_name(headers, name, rjson::from_string(value));
            }
            rjson::add(part, "headers", std::move(headers));
            rjson::push_back(parts, std::move(part));
        }
        rjson::add(file, "parts", std::move(parts));
        rjson::push_back(files, std::move(file));
    }
    rjson::add(ret, "files", std::move(files));
    return ret;
}

// Runs a request under the server gate and turns whatever it throws into
// an error reply.
class json_handler : public httpd::handler_base {
    gate& _pending;
protected:
    ingest::upload_session_manager& _manager;

    virtual future<rjson::value> do_handle(request& req) = 0;

    static rjson::value parse_body(const request& req) {
        if (req.content.empty()) {
            throw rjson::error("request body is empty");
        }
        auto body = rjson::parse(std::string_view(req.content));
        if (!body.IsObject()) {
            throw rjson::error("request body must be a JSON object");
        }
        return body;
    }
public:
    json_handler(gate& pending, ingest::upload_session_manager& manager)
        : _pending(pending)
        , _manager(manager)
    {}

    future<std::unique_ptr<reply>> handle(const sstring& path, std::unique_ptr<request> req, std::unique_ptr<reply> rep) override {
        auto holder = _pending.hold();
        apil.trace("{} {}", req->_method, req->_url);
        std::exception_ptr ex;
        try {
            auto result = co_await do_handle(*req);
            rep->set_status(reply::status_type::ok);
            rep->write_body("json", sstring(rjson::print(result)));
        } catch (...) {
            ex = std::current_exception();
        }
        if (ex) {
            apil.debug("{} {} failed: {}", req->_method, req->_url, ex);
            generate_error_reply(*rep, std::move(ex));
        }
        co_return std::move(rep);
    }
};

class init_handler : public json_handler {
protected:
    future<rjson::value> do_handle(request& req) override {
        auto body = parse_body(req);
        const auto& files = rjson::get(body, "files");
        if (!files.IsArray()) {
            throw rjson::error("files must be an array");
        }
        std::vector<ingest::file_request> requests;
        for (const auto& f : files.GetArray()) {
            requests.push_back(ingest::file_request{
                .name = rjson::get_string(f, "name"),
                .size = rjson::get_uint64(f, "size"),
            });
        }
        auto desc = co_await _manager.init(std::move(requests), rjson::get_string(body, "password"));
        co_return to_json(desc);
    }
public:
    using json_handler::json_handler;
};

class chunk_confirm_handler : public json_handler {
protected:
    future<rjson::value> do_handle(request& req) override {
        auto body = parse_body(req);
        auto res = co_await _manager.confirm_chunk(
                rjson::get_string(body, "sessionId"),
                rjson::get_string(body, "fileName"),
                get_unsigned(body, "chunkIndex"),
                get_unsigned(body, "partNumber"),
                rjson::get_string(body, "etag"));
        rjson::value ret = rjson::empty_object();
        rjson::add(ret, "uploadedCount", rjson::value(res.uploaded_count));
        rjson::add(ret, "totalChunks", rjson::value(res.total_chunks));
        rjson::add(ret, "isNew", rjson::value(res.is_new));
        rjson::add(ret, "progress", rjson::value(res.progress));
        co_return ret;
    }
public:
    using json_handler::json_handler;
};

class complete_handler : public json_handler {
protected:
    future<rjson::value> do_handle(request& req) override {
        auto body = parse_body(req);
        auto res = co_await _manager.seal(rjson::get_string(body, "sessionId"));
        rjson::value ret = rjson::empty_object();
        rjson::add(ret, "status", ingest::to_string(res.status));
        if (res.archive_id) {
            rjson::add(ret, "archiveId", std::string_view(*res.archive_id));
        }
        co_return ret;
    }
public:
    using json_handler::json_handler;
};

class status_handler : public json_handler {
protected:
    future<rjson::value> do_handle(request& req) override {
        auto session_id = req.get_query_param("sessionId");
        if (session_id.empty()) {
            throw ingest::invalid_input_error("missing sessionId");
        }
        auto st = co_await _manager.status(std::move(session_id));
        rjson::value ret = rjson::empty_object();
        rjson::add(ret, "state", ingest::to_string(st.state));
        rjson::add(ret, "progress", rjson::value(st.progress));
        if (st.archive_id) {
            rjson::add(ret, "archiveId", std::string_view(*st.archive_id));
        }
        if (st.error) {
            rjson::add(ret, "error", std::string_view(*st.error));
        }
        co_return ret;
    }
public:
    using json_handler::json_handler;
};

server::server(ingest::upload_session_manager& manager)
    : _manager(manager)
    , _http_server("http-fastfile")
{}

void server::set_routes(httpd::routes& r) {
    r.put(httpd::operation_type::POST, "/api/upload/init", new init_handler(_pending_requests, _manager));
    r.put(httpd::operation_type::POST, "/api/upload/chunk-confirm", new chunk_confirm_handler(_pending_requests, _manager));
    r.put(httpd::operation_type::POST, "/api/upload/complete", new complete_handler(_pending_requests, _manager));
    r.put(httpd::operation_type::GET, "/api/upload/status", new status_handler(_pending_requests, _manager));
}

future<> server::init(const api_config& cfg) {
    set_routes(_http_server._routes);
    _http_server.set_content_length_limit(cfg.content_length_limit);
    auto addr = net::inet_address(cfg.address);
    co_await _http_server.listen(socket_address{addr, cfg.port});
    apil.info("Listening on {}:{}", cfg.address, cfg.port);
}

future<> server::stop() {
    co_await _http_server.stop();
    co_await _pending_requests.close();
    apil.info("Stopped");
}

} // namespace api
