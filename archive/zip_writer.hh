/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <seastar/core/future.hh>
#include <seastar/core/temporary_buffer.hh>
#include <seastar/util/noncopyable_function.hh>

namespace archive {

using namespace seastar;

using byte_sink = noncopyable_function<future<>(temporary_buffer<char>)>;

struct dos_datetime {
    uint16_t time;
    uint16_t date;
};

// Clamped to the 1980..2107 range of the format.
dos_datetime to_dos_datetime(std::chrono::system_clock::time_point tp) noexcept;

// Streaming ZIP writer, store method only. Entry data goes out as is with
// the sizes and CRC-32 in a trailing data descriptor, so nothing has to be
// known up front. ZIP64 records are used for whatever exceeds the classic
// limits: entry sizes, offsets, central directory size and entry count.
//
// Output is pushed to the sink in slices: headers as small buffers, data
// buffers without copying.
class zip_writer {
    struct entry {
        std::string name;
        uint32_t crc = 0;
        uint64_t size = 0;
        uint64_t local_header_offset = 0;
        bool zip64 = false;
    };

    byte_sink _sink;
    dos_datetime _mtime;
    uint64_t _offset = 0;
    std::vector<entry> _entries;
    std::optional<entry> _current;
    bool _finished = false;

    future<> emit(temporary_buffer<char> buf);
public:
    zip_writer(byte_sink sink, std::chrono::system_clock::time_point mtime);

    // A size hint of 4 GiB or more makes the entry a ZIP64 one.
    future<> begin_entry(std::string name, uint64_t size_hint);
    future<> write(temporary_buffer<char> data);
    future<> end_entry();
    future<> finish();

    uint64_t bytes_written() const noexcept { return _offset; }
    uint64_t current_entry_size() const noexcept;
    size_t entries() const noexcept { return _entries.size(); }
};

} // namespace archive
