/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <string>
#include <vector>
#include <seastar/core/gate.hh>
#include <seastar/core/lowres_clock.hh>
#include <seastar/core/semaphore.hh>
#include <seastar/core/shared_ptr.hh>
#include <seastar/core/timer.hh>
#include <seastar/http/client.hh>
#include <seastar/net/inet_address.hh>
#include <seastar/net/tls.hh>

#include "utils/log.hh"

namespace utils::http {

future<shared_ptr<tls::certificate_credentials>> system_trust_credentials();

struct url_info {
    std::string scheme;
    std::string host;
    std::string path;
    uint16_t port;

    bool is_https() const;
    // scheme://host[:port] without the path
    std::string origin() const;
};

// Accepts scheme://host[:port][/path]. Numeric IPv6 hosts go in brackets.
url_info parse_simple_url(std::string_view uri);

// Connects to a named host, re-resolving it when the DNS record TTL runs out
// and rotating over all resolved addresses.
class dns_connection_factory : public seastar::http::experimental::connection_factory {
    class connection_resources {
        shared_ptr<tls::certificate_credentials> _creds;
        std::string _host;
        bool _use_https;
        logging::logger& _logger;
        std::vector<net::inet_address> _addr_list;
        size_t _addr_pos = 0;
        std::chrono::seconds _address_ttl{0};
        bool _addr_init = false;
        bool _creds_init = false;
        semaphore _init_semaphore{1};
        gate _addr_update_gate;
        timer<lowres_clock> _addr_update_timer;

        future<> init_addresses();
        future<> init_credentials();
    public:
        connection_resources(const std::string& host, bool use_https, shared_ptr<tls::certificate_credentials> creds, logging::logger& logger);
        future<net::inet_address> get_address();
        future<shared_ptr<tls::certificate_credentials>> get_creds();
        future<> close();
    };

    std::string _host;
    int _port;
    logging::logger& _logger;
    connection_resources _provider;

    future<connected_socket> connect();
public:
    dns_connection_factory(std::string host, int port, bool use_https, logging::logger& logger, shared_ptr<tls::certificate_credentials> = {});
    dns_connection_factory(const url_info& url, logging::logger& logger, shared_ptr<tls::certificate_credentials> = {});

    future<connected_socket> make(abort_source*) override;
    future<> close() override;
};

} // namespace utils::http
