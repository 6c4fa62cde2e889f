/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <string_view>
#include <seastar/core/sstring.hh>

namespace ingest {

// Access secret policy. Only the hash of a secret is ever stored.
class credential_verifier {
public:
    virtual ~credential_verifier() = default;
    virtual bool is_valid(std::string_view secret) const = 0;
    virtual seastar::sstring hash(std::string_view secret) const = 0;
};

// Exactly four decimal digits, stored as hex SHA-256.
class pin_credential_verifier final : public credential_verifier {
public:
    bool is_valid(std::string_view secret) const override;
    seastar::sstring hash(std::string_view secret) const override;
};

// 128 random bits, hex encoded.
seastar::sstring make_random_id();

} // namespace ingest
