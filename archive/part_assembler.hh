/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <cstdint>
#include <optional>
#include <vector>
#include <seastar/core/temporary_buffer.hh>

namespace archive {

using namespace seastar;

// Cuts a stream of variable sized slices into parts of exactly part_size
// bytes. Whatever is left at the end is the final, shorter part.
class part_assembler {
    size_t _part_size;
    temporary_buffer<char> _current;
    size_t _filled = 0;
    unsigned _parts = 0;
    uint64_t _total = 0;

public:
    explicit part_assembler(size_t part_size);

    // Parts completed by this slice, in order.
    std::vector<temporary_buffer<char>> push(temporary_buffer<char> slice);
    // The remainder, if any. No more slices may be pushed after this.
    std::optional<temporary_buffer<char>> finish();

    size_t part_size() const noexcept { return _part_size; }
    size_t buffered() const noexcept { return _filled; }
    // Parts handed out so far.
    unsigned parts() const noexcept { return _parts; }
    uint64_t total_bytes() const noexcept { return _total; }
};

} // namespace archive
