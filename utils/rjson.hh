/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

/*
 * rjson is a thin wrapper over rapidjson used for the metadata records and
 * the HTTP API bodies. All values share one CrtAllocator, so values can be
 * moved between documents freely. Type mismatches and missing members throw
 * rjson::error instead of asserting.
 */

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace rjson {
class error : public std::exception {
    std::string _msg;
public:
    error() = default;
    error(const std::string& msg) : _msg(msg) {}

    virtual const char* what() const noexcept override { return _msg.c_str(); }
};
}

#define RAPIDJSON_HAS_STDSTRING 1
#define RAPIDJSON_ASSERT(x) do { if (!(x)) throw rjson::error(std::string("JSON error: condition not met: ") + #x); } while (0)

#include <rapidjson/document.h>
#include <rapidjson/writer.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/error/en.h>
#include <seastar/core/sstring.hh>
#include "seastarx.hh"

namespace rjson {

using allocator = rapidjson::CrtAllocator;
using encoding = rapidjson::UTF8<>;
using document = rapidjson::GenericDocument<encoding, allocator>;
using value = rapidjson::GenericValue<encoding, allocator>;
using string_ref_type = value::StringRefType;
using string_buffer = rapidjson::GenericStringBuffer<encoding>;
using writer = rapidjson::Writer<string_buffer, encoding>;

inline rjson::value null_value() {
    return rjson::value(rapidjson::kNullType);
}

inline rjson::value empty_object() {
    return rjson::value(rapidjson::kObjectType);
}

inline rjson::value empty_array() {
    return rjson::value(rapidjson::kArrayType);
}

// Dense JSON text, the opposite of parse().
std::string print(const rjson::value& value);

inline std::string_view to_string_view(const rjson::value& v) {
    return std::string_view(v.GetString(), v.GetStringLength());
}

// Throws rjson::error if parsing failed.
rjson::value parse(std::string_view str);

rjson::value from_string(std::string_view view);

const rjson::value* find(const rjson::value& value, rjson::string_ref_type name);
const rjson::value& get(const rjson::value& value, rjson::string_ref_type name);

// Typed accessors. They throw rjson::error naming the member when it is
// missing or has the wrong type.
sstring get_string(const rjson::value& value, rjson::string_ref_type name);
uint64_t get_uint64(const rjson::value& value, rjson::string_ref_type name);
int64_t get_int64(const rjson::value& value, rjson::string_ref_type name);
bool get_bool(const rjson::value& value, rjson::string_ref_type name);
std::optional<sstring> get_opt_string(const rjson::value& value, rjson::string_ref_type name);

// The name must outlive base (use literals); the member is moved in.
void add(rjson::value& base, rjson::string_ref_type name, rjson::value&& member);
void add(rjson::value& base, rjson::string_ref_type name, std::string_view member);
void add_with_string_name(rjson::value& base, std::string_view name, rjson::value&& member);

void push_back(rjson::value& base_array, rjson::value&& item);

} // namespace rjson
