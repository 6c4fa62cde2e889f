/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <exception>
#include <string>
#include <system_error>

// Storage failure that survived the retry policy. The error code tells the
// caller what kind of failure it was (ENOENT, EACCES, ETIMEDOUT, EIO).
class storage_io_error : public std::system_error {
public:
    storage_io_error(int err, std::string what)
        : std::system_error(err, std::system_category(), std::move(what)) {}

    explicit storage_io_error(const std::system_error& e) noexcept
        : std::system_error(e) {}
};

bool is_timeout_exception(std::exception_ptr e);
