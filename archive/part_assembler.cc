/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include <algorithm>
#include <cstring>
#include <stdexcept>
#include <utility>

#include "archive/part_assembler.hh"

namespace archive {

part_assembler::part_assembler(size_t part_size)
    : _part_size(part_size)
{
    if (_part_size == 0) {
        throw std::invalid_argument("part size must be positive");
    }
}

std::vector<temporary_buffer<char>> part_assembler::push(temporary_buffer<char> slice) {
    std::vector<temporary_buffer<char>> ready;
    _total += slice.size();
    while (!slice.empty()) {
        if (_current.empty()) {
            _current = temporary_buffer<char>(_part_size);
            _filled = 0;
        }
        auto n = std::min(_part_size - _filled, slice.size());
        std::memcpy(_current.get_write() + _filled, slice.get(), n);
        slice.trim_front(n);
        _filled += n;
        if (_filled == _part_size) {
            ready.push_back(std::move(_current));
            _current = {};
            _filled = 0;
            ++_parts;
        }
    }
    return ready;
}

std::optional<temporary_buffer<char>> part_assembler::finish() {
    if (_filled == 0) {
        return std::nullopt;
    }
    _current.trim(_filled);
    _filled = 0;
    ++_parts;
    return std::exchange(_current, {});
}

} // namespace archive
