/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include <cerrno>
#include <seastar/core/timed_out_error.hh>

#include "utils/exceptions.hh"

bool is_timeout_exception(std::exception_ptr e) {
    try {
        std::rethrow_exception(e);
    } catch (const seastar::timed_out_error&) {
        return true;
    } catch (const std::system_error& ex) {
        return ex.code().value() == ETIMEDOUT;
    } catch (const std::nested_exception& ex) {
        return is_timeout_exception(ex.nested_ptr());
    } catch (...) {
        return false;
    }
}
