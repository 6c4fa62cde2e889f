/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "http.hh"

#include <strings.h>
#include <algorithm>
#include <ranges>
#include <boost/regex.hpp>
#include <fmt/ranges.h>
#include <seastar/core/coroutine.hh>
#include <seastar/net/dns.hh>

namespace utils::http {

future<shared_ptr<tls::certificate_credentials>> system_trust_credentials() {
    static thread_local shared_ptr<tls::certificate_credentials> system_trust_credentials;
    if (!system_trust_credentials) {
        // can race, and overwrite the object. that is fine.
        auto cred = make_shared<tls::certificate_credentials>();
        co_await cred->set_system_trust();
        system_trust_credentials = std::move(cred);
    }
    co_return system_trust_credentials;
}

dns_connection_factory::connection_resources::connection_resources(const std::string& host, bool use_https,
        shared_ptr<tls::certificate_credentials> creds, logging::logger& logger)
    : _creds(std::move(creds))
    , _host(host)
    , _use_https(use_https)
    , _logger(logger)
    , _addr_update_gate("address_provider")
    , _addr_update_timer([this] {
        // the gate keeps this instance alive until the resolution is over
        std::ignore = with_gate(_addr_update_gate, [this] {
            _logger.debug("Host resolution of {} expired", _host);
            return init_addresses();
        }).handle_exception([this] (std::exception_ptr ex) {
            _logger.warn("Failed to re-resolve {}: {}", _host, ex);
            _addr_init = false;
        });
    })
{}

future<> dns_connection_factory::connection_resources::init_addresses() {
    _addr_init = false;
    auto hent = co_await net::dns::get_host_by_name(_host, net::inet_address::family::INET);
    if (hent.addr_entries.empty()) {
        throw std::runtime_error(fmt::format("No addresses resolved for {}", _host));
    }
    _address_ttl = std::ranges::min_element(hent.addr_entries, {}, &net::hostent::address_entry::ttl)->ttl;
    _addr_list = hent.addr_entries | std::views::transform(&net::hostent::address_entry::addr) | std::ranges::to<std::vector>();
    _logger.debug("Resolved {} to {} (ttl {}s)", _host, _addr_list, _address_ttl.count());
    if (_address_ttl.count() == 0) {
        // A zero TTL record is good for the current transaction only
        // https://datatracker.ietf.org/doc/html/rfc1035#section-3.2.1
        co_return;
    }
    _addr_update_timer.rearm(lowres_clock::now() + _address_ttl);
    _addr_init = true;
}

future<> dns_connection_factory::connection_resources::init_credentials() {
    if (_use_https && !_creds) {
        _creds = co_await system_trust_credentials();
    }
    if (!_use_https) {
        _creds = {};
    }
    _logger.debug("Initialized credentials for {}, tls={}", _host, _creds == nullptr ? "no" : "yes");
}

future<net::inet_address> dns_connection_factory::connection_resources::get_address() {
    if (!_addr_init) [[unlikely]] {
        auto units = co_await get_units(_init_semaphore, 1);
        if (!_addr_init) {
            co_await init_addresses();
        }
    }
    co_return _addr_list[_addr_pos++ % _addr_list.size()];
}

future<shared_ptr<tls::certificate_credentials>> dns_connection_factory::connection_resources::get_creds() {
    if (!_creds_init) [[unlikely]] {
        auto units = co_await get_units(_init_semaphore, 1);
        if (!_creds_init) {
            co_await init_credentials();
            _creds_init = true;
        }
    }
    co_return _creds;
}

future<> dns_connection_factory::connection_resources::close() {
    _addr_update_timer.cancel();
    return _addr_update_gate.close();
}

dns_connection_factory::dns_connection_factory(std::string host, int port, bool use_https, logging::logger& logger, shared_ptr<tls::certificate_credentials> certs)
    : _host(std::move(host))
    , _port(port)
    , _logger(logger)
    , _provider(_host, use_https, std::move(certs), _logger)
{}

dns_connection_factory::dns_connection_factory(const url_info& url, logging::logger& logger, shared_ptr<tls::certificate_credentials> certs)
    : dns_connection_factory(url.host, url.port, url.is_https(), logger, std::move(certs))
{
    if (!url.path.empty() && url.path != "/") {
        throw std::invalid_argument(fmt::format("Cannot handle path in URI: {}", url.path));
    }
}

future<connected_socket> dns_connection_factory::connect() {
    auto socket_addr = socket_address(co_await _provider.get_address(), _port);
    if (auto creds = co_await _provider.get_creds()) {
        _logger.debug("Making new HTTPS connection addr={} host={}", socket_addr, _host);
        co_return co_await tls::connect(creds, socket_addr, tls::tls_options{.server_name = _host});
    }
    _logger.debug("Making new HTTP connection addr={} host={}", socket_addr, _host);
    co_return co_await seastar::connect(socket_addr, {}, transport::TCP);
}

future<connected_socket> dns_connection_factory::make(abort_source*) {
    return connect();
}

future<> dns_connection_factory::close() {
    return _provider.close();
}

static const char HTTPS[] = "https";

url_info parse_simple_url(std::string_view uri) {
    // http://[2001:db8:4006:812::200e]:8080/path
    static const boost::regex simple_url(R"foo(([a-zA-Z]+):\/\/((?:\[[^\]]+\])|[^\/:]+)(:\d+)?(\/.*)?)foo");

    boost::smatch m;
    std::string tmp(uri);
    if (!boost::regex_match(tmp, m, simple_url)) {
        throw std::invalid_argument(fmt::format("Could not parse URI {}", uri));
    }

    auto scheme = m[1].str();
    auto host = m[2].str();
    auto port = m[3].str();
    auto path = m[4].str();
    bool https = (strcasecmp(scheme.c_str(), HTTPS) == 0);

    if (host.size() > 2 && host.front() == '[' && host.back() == ']') {
        host = host.substr(1, host.size() - 2);
    }
    return url_info {
        .scheme = std::move(scheme),
        .host = std::move(host),
        .path = std::move(path),
        .port = uint16_t(port.empty() ? (https ? 443 : 80) : std::stoi(port.substr(1))),
    };
}

bool url_info::is_https() const {
    return strcasecmp(scheme.c_str(), HTTPS) == 0;
}

std::string url_info::origin() const {
    bool default_port = port == (is_https() ? 443 : 80);
    auto h = host.find(':') != std::string::npos ? fmt::format("[{}]", host) : host;
    return default_port ? fmt::format("{}://{}", scheme, h) : fmt::format("{}://{}:{}", scheme, h, port);
}

} // namespace utils::http
