/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "ingest/exceptions.hh"

namespace ingest {

session_not_found::session_not_found(std::string_view session_id)
    : invalid_input_error(fmt::format("upload session {} not found", session_id))
{}

static std::string describe(const missing_chunks& missing) {
    std::string ret = "upload is incomplete, missing chunks:";
    for (const auto& [file, indices] : missing) {
        ret += fmt::format(" {} {}", file, indices);
    }
    return ret;
}

incomplete_upload_error::incomplete_upload_error(missing_chunks missing)
    : std::runtime_error(describe(missing))
    , _missing(std::move(missing))
{}

} // namespace ingest
