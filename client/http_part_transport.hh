/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <memory>
#include <unordered_map>
#include <seastar/http/client.hh>

#include "client/part_transport.hh"

namespace client {

// PUTs parts over HTTP(S), one connection pool per storage origin.
class http_part_transport final : public part_transport {
    unsigned _max_connections;
    std::unordered_map<std::string, std::unique_ptr<http::experimental::client>> _clients;

    http::experimental::client& client_for(const std::string& scheme, const std::string& host, uint16_t port);
public:
    explicit http_part_transport(unsigned max_connections = 3);

    future<sstring> put_part(const ingest::part_descriptor& part, temporary_buffer<char> data, abort_source* as = nullptr) override;
    future<> close() override;
};

} // namespace client
