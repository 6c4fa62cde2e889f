/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <seastar/core/future.hh>
#include <seastar/core/gate.hh>
#include <seastar/core/sstring.hh>
#include <seastar/core/units.hh>
#include <seastar/http/httpd.hh>
#include <seastar/http/reply.hh>

#include "ingest/upload_session_manager.hh"

namespace api {

using namespace seastar;

struct api_config {
    sstring address = "0.0.0.0";
    uint16_t port = 8080;
    // requests are small JSON documents
    size_t content_length_limit = 1_MiB;
};

// Fills rep with the status and JSON error document the exception maps to.
void generate_error_reply(http::reply& rep, std::exception_ptr ex);

// HTTP front end of the upload session manager:
//
//   POST /api/upload/init
//   POST /api/upload/chunk-confirm
//   POST /api/upload/complete
//   GET  /api/upload/status?sessionId=
//
// Bodies in both directions are JSON.
class server {
    ingest::upload_session_manager& _manager;
    httpd::http_server _http_server;
    gate _pending_requests;

    void set_routes(httpd::routes& r);
public:
    explicit server(ingest::upload_session_manager& manager);

    future<> init(const api_config& cfg);
    // Stops accepting requests and waits for the running ones.
    future<> stop();
};

} // namespace api
