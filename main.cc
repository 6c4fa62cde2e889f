/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include <csignal>
#include <seastar/core/app-template.hh>
#include <seastar/core/coroutine.hh>
#include <seastar/core/reactor.hh>
#include <seastar/coroutine/exception.hh>

#include "api/upload_handlers.hh"
#include "archive/archive_builder.hh"
#include "config/service_config.hh"
#include "ingest/credentials.hh"
#include "ingest/upload_session_manager.hh"
#include "kv/memory_metadata_store.hh"
#include "utils/log.hh"
#include "utils/observer.hh"
#include "utils/s3/client.hh"
#include "utils/s3/multipart_storage_client.hh"

static logging::logger startlog("init");

int main(int argc, char** argv) {
    namespace bpo = boost::program_options;
    app_template::config app_cfg;
    app_cfg.name = "fastfile";
    app_cfg.description = "Chunked upload ingestion and archive repacking service";
    app_template app(std::move(app_cfg));
    app.add_options()
        ("config", bpo::value<sstring>()->default_value("conf/fastfile.yaml"), "configuration file")
        ("api-port", bpo::value<uint16_t>(), "listen on this port instead of api.port")
    ;

    return app.run(argc, argv, [&app] () -> future<> {
        auto& opts = app.configuration();
        auto cfg = co_await config::read_service_config(opts["config"].as<sstring>());
        if (opts.contains("api-port")) {
            cfg.api.port = opts["api-port"].as<uint16_t>();
        }
        startlog.info("Using bucket {} at {}:{}", cfg.storage.bucket, cfg.s3.host, cfg.s3.port);

        utils::metrics_observer observer;
        auto client = s3::client::make(make_lw_shared<s3::endpoint_config>(cfg.s3));
        s3::multipart_storage_client storage(client, cfg.storage, cfg.retry, observer);
        kv::memory_metadata_store metadata;
        ingest::pin_credential_verifier verifier;
        archive::archive_builder builder(storage, cfg.archive);
        ingest::upload_session_manager manager(storage, metadata, builder, verifier, cfg.ingest, observer);
        api::server server(manager);

        promise<> stop_requested;
        bool stopping = false;
        auto on_signal = [&stop_requested, &stopping] {
            if (!stopping) {
                stopping = true;
                stop_requested.set_value();
            }
        };
        engine().handle_signal(SIGINT, on_signal);
        engine().handle_signal(SIGTERM, on_signal);

        std::exception_ptr ex;
        try {
            co_await server.init(cfg.api);
            startlog.info("fastfile is ready");
            co_await stop_requested.get_future();
            startlog.info("Shutting down");
        } catch (...) {
            ex = std::current_exception();
            startlog.error("Startup failed: {}", ex);
        }

        co_await server.stop();
        co_await manager.stop();
        co_await client->close();
        if (ex) {
            co_await coroutine::return_exception_ptr(std::move(ex));
        }
    });
}
