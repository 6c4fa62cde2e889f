/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <map>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace ingest {

// Bad request from the caller. Never retried.
class invalid_input_error : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

class session_not_found : public invalid_input_error {
public:
    explicit session_not_found(std::string_view session_id);
};

// file name -> chunk indices without a confirmation
using missing_chunks = std::map<std::string, std::vector<unsigned>>;

class incomplete_upload_error : public std::runtime_error {
    missing_chunks _missing;
public:
    explicit incomplete_upload_error(missing_chunks missing);

    const missing_chunks& missing() const noexcept { return _missing; }
};

// The storage side disagrees with what was recorded, e.g. one chunk was
// confirmed with two different ETags.
class remote_inconsistency_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace ingest
