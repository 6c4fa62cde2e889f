/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "utils/s3/retry.hh"

namespace s3 {

logging::logger retry_logger("retry");

} // namespace s3
