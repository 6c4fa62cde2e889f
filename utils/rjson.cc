/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "utils/rjson.hh"
#include <seastar/core/format.hh>

namespace rjson {

static allocator the_allocator;

std::string print(const rjson::value& value) {
    string_buffer buffer;
    writer w(buffer);
    value.Accept(w);
    return std::string(buffer.GetString(), buffer.GetSize());
}

rjson::value parse(std::string_view str) {
    document d;
    d.Parse(str.data(), str.size());
    if (d.HasParseError()) {
        throw rjson::error(seastar::format("Parsing JSON failed: {} at offset {}", GetParseError_En(d.GetParseError()), d.GetErrorOffset()));
    }
    rjson::value& v = d;
    return std::move(v);
}

rjson::value from_string(std::string_view view) {
    return rjson::value(view.data(), view.size(), the_allocator);
}

const rjson::value* find(const rjson::value& value, string_ref_type name) {
    if (!value.IsObject()) {
        return nullptr;
    }
    auto member_it = value.FindMember(name);
    return member_it != value.MemberEnd() ? &member_it->value : nullptr;
}

const rjson::value& get(const rjson::value& value, rjson::string_ref_type name) {
    if (auto* v = find(value, name)) {
        return *v;
    }
    throw rjson::error(seastar::format("JSON parameter {} not found", name.s));
}

sstring get_string(const rjson::value& value, rjson::string_ref_type name) {
    const auto& v = get(value, name);
    if (!v.IsString()) {
        throw rjson::error(seastar::format("JSON parameter {} is not a string", name.s));
    }
    return sstring(v.GetString(), v.GetStringLength());
}

uint64_t get_uint64(const rjson::value& value, rjson::string_ref_type name) {
    const auto& v = get(value, name);
    if (!v.IsUint64()) {
        throw rjson::error(seastar::format("JSON parameter {} is not an unsigned integer", name.s));
    }
    return v.GetUint64();
}

int64_t get_int64(const rjson::value& value, rjson::string_ref_type name) {
    const auto& v = get(value, name);
    if (!v.IsInt64()) {
        throw rjson::error(seastar::format("JSON parameter {} is not an integer", name.s));
    }
    return v.GetInt64();
}

bool get_bool(const rjson::value& value, rjson::string_ref_type name) {
    const auto& v = get(value, name);
    if (!v.IsBool()) {
        throw rjson::error(seastar::format("JSON parameter {} is not a boolean", name.s));
    }
    return v.GetBool();
}

std::optional<sstring> get_opt_string(const rjson::value& value, rjson::string_ref_type name) {
    auto* v = find(value, name);
    if (!v || v->IsNull()) {
        return std::nullopt;
    }
    if (!v->IsString()) {
        throw rjson::error(seastar::format("JSON parameter {} is not a string", name.s));
    }
    return sstring(v->GetString(), v->GetStringLength());
}

void add(rjson::value& base, rjson::string_ref_type name, rjson::value&& member) {
    base.AddMember(name, std::move(member), the_allocator);
}

void add(rjson::value& base, rjson::string_ref_type name, std::string_view member) {
    base.AddMember(name, from_string(member), the_allocator);
}

void add_with_string_name(rjson::value& base, std::string_view name, rjson::value&& member) {
    base.AddMember(from_string(name), std::move(member), the_allocator);
}

void push_back(rjson::value& base_array, rjson::value&& item) {
    base_array.PushBack(std::move(item), the_allocator);
}

} // end namespace rjson
