/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include <algorithm>
#include <array>
#include <iterator>
#include <string>
#include <stdexcept>
#include <fmt/format.h>
#include <gnutls/crypto.h>
#include <gnutls/gnutls.h>

#include "ingest/credentials.hh"
#include "utils/aws_sigv4.hh"

namespace ingest {

bool pin_credential_verifier::is_valid(std::string_view secret) const {
    return secret.size() == 4 && std::ranges::all_of(secret, [] (char c) { return c >= '0' && c <= '9'; });
}

seastar::sstring pin_credential_verifier::hash(std::string_view secret) const {
    return seastar::sstring(utils::aws::sha256_hex(secret));
}

seastar::sstring make_random_id() {
    std::array<unsigned char, 16> bytes;
    int ret = gnutls_rnd(GNUTLS_RND_NONCE, bytes.data(), bytes.size());
    if (ret) {
        throw std::runtime_error(fmt::format("Generating random id failed ({}): {}", ret, gnutls_strerror(ret)));
    }
    std::string id;
    for (auto b : bytes) {
        fmt::format_to(std::back_inserter(id), "{:02x}", b);
    }
    return seastar::sstring(id);
}

} // namespace ingest
