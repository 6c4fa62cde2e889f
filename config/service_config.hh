/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <string_view>
#include <seastar/core/future.hh>
#include <seastar/core/sstring.hh>

#include "api/upload_handlers.hh"
#include "archive/archive_builder.hh"
#include "ingest/upload_session_manager.hh"
#include "utils/s3/client.hh"
#include "utils/s3/multipart_storage_client.hh"
#include "utils/s3/retry_strategy.hh"

namespace config {

using namespace seastar;

// Everything the service binary needs, one YAML section per member:
//
//   s3:      endpoint and credentials
//   retry:   retry policy of all storage calls
//   storage: bucket and per-call timeout
//   ingest:  chunking and session handling
//   archive: archive builder
//   api:     HTTP listener
//
// Absent sections and keys keep their defaults. The credentials fall back
// to the AWS_* environment variables when the file does not set them.
struct service_config {
    s3::endpoint_config s3;
    aws::retry_config retry;
    s3::storage_client_config storage;
    ingest::ingest_config ingest;
    archive::builder_config archive;
    api::api_config api;
};

// Throws std::invalid_argument naming the first bad setting.
void validate(const service_config& cfg);

// Parses and validates YAML text.
service_config parse_service_config(std::string_view yaml);
future<service_config> read_service_config(sstring path);

} // namespace config
