/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include <cstdlib>
#include <unordered_set>
#include <yaml-cpp/yaml.h>
#include <seastar/core/coroutine.hh>
#include <seastar/core/file.hh>
#include <seastar/core/seastar.hh>
#include <seastar/coroutine/exception.hh>

#include "config/service_config.hh"
#include "utils/log.hh"

static logging::logger cfglog("config");

namespace {

template <typename T>
void get_opt(const YAML::Node& node, const char* key, T& value) {
    if (auto child = node[key]) {
        value = child.as<T>();
    }
}

void get_opt(const YAML::Node& node, const char* key, seastar::sstring& value) {
    if (auto child = node[key]) {
        value = seastar::sstring(child.as<std::string>());
    }
}

void get_opt(const YAML::Node& node, const char* key, std::chrono::milliseconds& value) {
    if (auto child = node[key]) {
        value = std::chrono::milliseconds(child.as<int64_t>());
    }
}

// Value in the file has priority, the environment fills the gaps.
void get_node_value_or_env(const YAML::Node& node, const char* key, const char* var, std::string& value) {
    if (auto child = node[key]) {
        value = child.as<std::string>();
    } else if (auto env = std::getenv(var)) {
        value = env;
    }
}

}

namespace YAML {

template<>
struct convert<s3::endpoint_config> {
    static bool decode(const Node& node, s3::endpoint_config& ep) {
        get_opt(node, "host", ep.host);
        get_opt(node, "port", ep.port);
        get_opt(node, "https", ep.use_https);
        get_node_value_or_env(node, "region", "AWS_DEFAULT_REGION", ep.region);
        get_node_value_or_env(node, "access_key_id", "AWS_ACCESS_KEY_ID", ep.access_key_id);
        get_node_value_or_env(node, "secret_access_key", "AWS_SECRET_ACCESS_KEY", ep.secret_access_key);
        get_node_value_or_env(node, "session_token", "AWS_SESSION_TOKEN", ep.session_token);
        if (auto max_conn = node["max_connections"]) {
            ep.max_connections = max_conn.as<unsigned>();
        }
        return true;
    }
};

template<>
struct convert<aws::retry_config> {
    static bool decode(const Node& node, aws::retry_config& cfg) {
        get_opt(node, "max_attempts", cfg.max_attempts);
        get_opt(node, "base_delay_ms", cfg.base_delay);
        get_opt(node, "jitter_ms", cfg.jitter);
        return true;
    }
};

template<>
struct convert<s3::storage_client_config> {
    static bool decode(const Node& node, s3::storage_client_config& cfg) {
        get_opt(node, "bucket", cfg.bucket);
        get_opt(node, "call_timeout_ms", cfg.call_timeout);
        return true;
    }
};

template<>
struct convert<ingest::ingest_config> {
    static bool decode(const Node& node, ingest::ingest_config& cfg) {
        get_opt(node, "chunk_size", cfg.chunk_size);
        if (auto ttl = node["archive_ttl_hours"]) {
            cfg.archive_ttl = std::chrono::hours(ttl.as<int64_t>());
        }
        get_opt(node, "background_archiving", cfg.background_archiving);
        get_opt(node, "list_page_size", cfg.ledger.list_page_size);
        get_opt(node, "fetch_concurrency", cfg.ledger.fetch_concurrency);
        return true;
    }
};

template<>
struct convert<archive::builder_config> {
    static bool decode(const Node& node, archive::builder_config& cfg) {
        get_opt(node, "part_size", cfg.part_size);
        get_opt(node, "read_window", cfg.read_window);
        get_opt(node, "max_inflight_parts", cfg.max_inflight_parts);
        get_opt(node, "channel_capacity", cfg.channel_capacity);
        get_opt(node, "finalize_timeout_ms", cfg.finalize_timeout);
        get_opt(node, "delete_sources", cfg.delete_sources);
        return true;
    }
};

template<>
struct convert<api::api_config> {
    static bool decode(const Node& node, api::api_config& cfg) {
        get_opt(node, "address", cfg.address);
        get_opt(node, "port", cfg.port);
        get_opt(node, "content_length_limit", cfg.content_length_limit);
        return true;
    }
};

}

namespace config {

void validate(const service_config& cfg) {
    if (cfg.s3.host.empty()) {
        throw std::invalid_argument("s3.host is not set");
    }
    if (cfg.s3.port == 0 || cfg.s3.port > 65535) {
        throw std::invalid_argument(fmt::format("s3.port {} is out of range", cfg.s3.port));
    }
    if (cfg.s3.access_key_id.empty() || cfg.s3.secret_access_key.empty()) {
        throw std::invalid_argument("s3 credentials are not set, neither in the file nor in AWS_ACCESS_KEY_ID and AWS_SECRET_ACCESS_KEY");
    }
    if (cfg.retry.max_attempts == 0) {
        throw std::invalid_argument("retry.max_attempts must be at least 1");
    }
    if (cfg.storage.bucket.empty()) {
        throw std::invalid_argument("storage.bucket is not set");
    }
    if (cfg.storage.call_timeout.count() <= 0) {
        throw std::invalid_argument("storage.call_timeout_ms must be positive");
    }
    ingest::validate(cfg.ingest);
    archive::validate(cfg.archive);
}

// Every section is a mapping, decoding it into the default fills the
// absent keys.
template <typename T>
static void decode_section(const YAML::Node& doc, const char* name, T& value) {
    auto node = doc[name];
    if (!node) {
        return;
    }
    if (!node.IsMap()) {
        throw std::invalid_argument(fmt::format("section {} must be a mapping", name));
    }
    YAML::convert<T>::decode(node, value);
}

service_config parse_service_config(std::string_view yaml) {
    static const std::unordered_set<std::string> sections = {"s3", "retry", "storage", "ingest", "archive", "api"};

    YAML::Node doc = YAML::Load(std::string(yaml));
    if (doc.IsNull()) {
        doc = YAML::Node(YAML::NodeType::Map);
    }
    if (!doc.IsMap()) {
        throw std::invalid_argument("the configuration must be a mapping");
    }
    for (auto&& section : doc) {
        auto name = section.first.as<std::string>();
        if (!sections.contains(name)) {
            throw std::invalid_argument(fmt::format("unknown configuration section {}", name));
        }
    }

    service_config cfg;
    if (doc["s3"]) {
        decode_section(doc, "s3", cfg.s3);
    } else {
        // the environment can still provide the credentials
        YAML::convert<s3::endpoint_config>::decode(YAML::Node(YAML::NodeType::Map), cfg.s3);
    }
    decode_section(doc, "retry", cfg.retry);
    decode_section(doc, "storage", cfg.storage);
    decode_section(doc, "ingest", cfg.ingest);
    decode_section(doc, "archive", cfg.archive);
    decode_section(doc, "api", cfg.api);
    validate(cfg);
    return cfg;
}

future<service_config> read_service_config(sstring path) {
    cfglog.info("Reading configuration from {}", path);
    auto cfg_file = co_await open_file_dma(path, open_flags::ro);
    sstring data;
    std::exception_ptr ex;

    try {
        auto sz = co_await cfg_file.size();
        data = seastar::to_sstring(co_await cfg_file.dma_read_exactly<char>(0, sz));
    } catch (...) {
        ex = std::current_exception();
    }
    co_await cfg_file.close();
    if (ex) {
        co_await coroutine::return_exception_ptr(ex);
    }

    try {
        co_return parse_service_config(std::string_view(data));
    } catch (const YAML::Exception& e) {
        ex = std::make_exception_ptr(std::invalid_argument(fmt::format("{}: {}", path, e.what())));
    }
    co_await coroutine::return_exception_ptr(ex);
}

} // namespace config
