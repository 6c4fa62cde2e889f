/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include <ctime>
#include <limits>
#include <stdexcept>
#include <fmt/format.h>
#include <seastar/core/coroutine.hh>
#include <zlib.h>

#include "archive/zip_writer.hh"

// https://pkware.cachefly.net/webdocs/casestudies/APPNOTE.TXT
namespace archive {

static constexpr uint32_t local_file_header_signature = 0x04034b50;
static constexpr uint32_t data_descriptor_signature = 0x08074b50;
static constexpr uint32_t central_directory_signature = 0x02014b50;
static constexpr uint32_t zip64_end_of_central_directory_signature = 0x06064b50;
static constexpr uint32_t zip64_end_of_central_directory_locator_signature = 0x07064b50;
static constexpr uint32_t end_of_central_directory_signature = 0x06054b50;

static constexpr uint16_t version_default = 20;
static constexpr uint16_t version_zip64 = 45;
// bit 3: sizes and crc in the data descriptor, bit 11: UTF-8 names
static constexpr uint16_t general_purpose_flags = 0x0808;
static constexpr uint16_t method_store = 0;
static constexpr uint16_t zip64_extra_id = 0x0001;

static constexpr uint32_t max32 = std::numeric_limits<uint32_t>::max();
static constexpr uint16_t max16 = std::numeric_limits<uint16_t>::max();

namespace {

// Little-endian record builder.
class record {
    std::string _buf;
public:
    record& u16(uint16_t v) {
        _buf.push_back(char(v & 0xff));
        _buf.push_back(char(v >> 8));
        return *this;
    }
    record& u32(uint32_t v) {
        return u16(uint16_t(v & 0xffff)).u16(uint16_t(v >> 16));
    }
    record& u64(uint64_t v) {
        return u32(uint32_t(v & 0xffffffff)).u32(uint32_t(v >> 32));
    }
    record& bytes(std::string_view v) {
        _buf.append(v);
        return *this;
    }
    size_t size() const noexcept { return _buf.size(); }
    temporary_buffer<char> release() const {
        return temporary_buffer<char>(_buf.data(), _buf.size());
    }
};

}

dos_datetime to_dos_datetime(std::chrono::system_clock::time_point tp) noexcept {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm;
    ::gmtime_r(&t, &tm);
    int year = tm.tm_year + 1900;
    if (year < 1980) {
        return dos_datetime{0, uint16_t((0 << 9) | (1 << 5) | 1)};
    }
    if (year > 2107) {
        return dos_datetime{uint16_t((23 << 11) | (59 << 5) | 29), uint16_t((127 << 9) | (12 << 5) | 31)};
    }
    return dos_datetime{
        .time = uint16_t((tm.tm_hour << 11) | (tm.tm_min << 5) | (tm.tm_sec / 2)),
        .date = uint16_t(((year - 1980) << 9) | ((tm.tm_mon + 1) << 5) | tm.tm_mday),
    };
}

zip_writer::zip_writer(byte_sink sink, std::chrono::system_clock::time_point mtime)
    : _sink(std::move(sink))
    , _mtime(to_dos_datetime(mtime))
{}

future<> zip_writer::emit(temporary_buffer<char> buf) {
    _offset += buf.size();
    return _sink(std::move(buf));
}

uint64_t zip_writer::current_entry_size() const noexcept {
    return _current ? _current->size : 0;
}

future<> zip_writer::begin_entry(std::string name, uint64_t size_hint) {
    if (_finished || _current) {
        throw std::logic_error("zip entry started out of order");
    }
    if (name.empty() || name.size() > max16) {
        throw std::invalid_argument(fmt::format("bad zip entry name length {}", name.size()));
    }
    entry e{
        .name = std::move(name),
        .local_header_offset = _offset,
        .zip64 = size_hint >= max32,
    };

    record r;
    r.u32(local_file_header_signature)
     .u16(e.zip64 ? version_zip64 : version_default)
     .u16(general_purpose_flags)
     .u16(method_store)
     .u16(_mtime.time)
     .u16(_mtime.date)
     .u32(0) // crc, in the data descriptor
     .u32(e.zip64 ? max32 : 0)
     .u32(e.zip64 ? max32 : 0)
     .u16(e.name.size())
     .u16(e.zip64 ? 20 : 0)
     .bytes(e.name);
    if (e.zip64) {
        r.u16(zip64_extra_id).u16(16).u64(0).u64(0);
    }
    _current = std::move(e);
    co_await emit(r.release());
}

future<> zip_writer::write(temporary_buffer<char> data) {
    if (!_current) {
        throw std::logic_error("zip data written outside of an entry");
    }
    // zlib takes uInt lengths
    const char* p = data.get();
    size_t left = data.size();
    while (left > 0) {
        auto n = std::min<size_t>(left, std::numeric_limits<uInt>::max());
        _current->crc = ::crc32(_current->crc, reinterpret_cast<const Bytef*>(p), uInt(n));
        p += n;
        left -= n;
    }
    _current->size += data.size();
    if (data.empty()) {
        co_return;
    }
    co_await emit(std::move(data));
}

future<> zip_writer::end_entry() {
    if (!_current) {
        throw std::logic_error("zip entry ended without being started");
    }
    auto e = std::move(*_current);
    _current.reset();
    if (!e.zip64 && e.size >= max32) {
        throw std::runtime_error(fmt::format("zip entry {} grew to {} bytes without ZIP64 sizes", e.name, e.size));
    }

    record r;
    r.u32(data_descriptor_signature).u32(e.crc);
    if (e.zip64) {
        r.u64(e.size).u64(e.size);
    } else {
        r.u32(e.size).u32(e.size);
    }
    _entries.push_back(std::move(e));
    co_await emit(r.release());
}

future<> zip_writer::finish() {
    if (_finished || _current) {
        throw std::logic_error("zip archive finished out of order");
    }
    _finished = true;

    const uint64_t cd_offset = _offset;
    for (const auto& e : _entries) {
        bool zip64_sizes = e.size >= max32;
        bool zip64_offset = e.local_header_offset >= max32;
        record extra;
        if (zip64_sizes) {
            extra.u64(e.size).u64(e.size);
        }
        if (zip64_offset) {
            extra.u64(e.local_header_offset);
        }
        bool zip64 = zip64_sizes || zip64_offset;

        record r;
        r.u32(central_directory_signature)
         .u16(version_zip64) // made by
         .u16(zip64 || e.zip64 ? version_zip64 : version_default)
         .u16(general_purpose_flags)
         .u16(method_store)
         .u16(_mtime.time)
         .u16(_mtime.date)
         .u32(e.crc)
         .u32(zip64_sizes ? max32 : uint32_t(e.size))
         .u32(zip64_sizes ? max32 : uint32_t(e.size))
         .u16(e.name.size())
         .u16(zip64 ? extra.size() + 4 : 0)
         .u16(0) // comment
         .u16(0) // disk
         .u16(0) // internal attributes
         .u32(0) // external attributes
         .u32(zip64_offset ? max32 : uint32_t(e.local_header_offset))
         .bytes(e.name);
        if (zip64) {
            r.u16(zip64_extra_id).u16(extra.size());
        }
        co_await emit(r.release());
        if (zip64) {
            co_await emit(extra.release());
        }
    }
    const uint64_t cd_size = _offset - cd_offset;
    const uint64_t count = _entries.size();

    if (count >= max16 || cd_size >= max32 || cd_offset >= max32) {
        const uint64_t zip64_eocd_offset = _offset;
        record r;
        r.u32(zip64_end_of_central_directory_signature)
         .u64(44)
         .u16(version_zip64)
         .u16(version_zip64)
         .u32(0)
         .u32(0)
         .u64(count)
         .u64(count)
         .u64(cd_size)
         .u64(cd_offset)
         .u32(zip64_end_of_central_directory_locator_signature)
         .u32(0)
         .u64(zip64_eocd_offset)
         .u32(1);
        co_await emit(r.release());
    }

    record r;
    r.u32(end_of_central_directory_signature)
     .u16(0)
     .u16(0)
     .u16(count >= max16 ? max16 : uint16_t(count))
     .u16(count >= max16 ? max16 : uint16_t(count))
     .u32(cd_size >= max32 ? max32 : uint32_t(cd_size))
     .u32(cd_offset >= max32 ? max32 : uint32_t(cd_offset))
     .u16(0);
    co_await emit(r.release());
}

} // namespace archive
