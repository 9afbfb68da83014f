/*
 * Copyright 2024 Redpanda Data, Inc.
 *
 * Use of this software is governed by the Business Source License
 * included in the file licenses/BSL.md
 *
 * As of the Change Date specified in that file, in accordance with
 * the Business Source License, use of this software will be governed
 * by the Apache License, Version 2.0
 */

#pragma once

#include "base/seastarx.h"

#include <seastar/core/sstring.hh>

#include <fmt/ostream.h>

#include <cstdint>
#include <iosfwd>
#include <string_view>

namespace mpu::http {

/// Pieces of an absolute http(s) URL needed to open a connection and write
/// a request line.
struct url_parts {
    ss::sstring scheme; // "http" or "https"
    ss::sstring host;
    uint16_t port{0};
    /// Path plus query string, sent verbatim as the request target.
    ss::sstring target;

    bool is_tls() const { return scheme == "https"; }

    /// host, or host:port when the port is not the scheme default.
    ss::sstring authority() const;

    bool operator==(const url_parts&) const = default;
    /// Prints the URL without its query string, which may carry a
    /// presigned signature.
    friend std::ostream& operator<<(std::ostream&, const url_parts&);
};

/// Parses an absolute http or https URL. Throws std::invalid_argument for
/// anything else, including URLs without a host.
url_parts parse_url(std::string_view url);

/// \p url up to, not including, the '?' that starts its query string.
std::string_view without_query(std::string_view url);

/// Appends \p path to \p base, collapsing a duplicated '/' at the seam.
ss::sstring join_url(std::string_view base, std::string_view path);

} // namespace mpu::http

template<>
struct fmt::formatter<mpu::http::url_parts> : fmt::ostream_formatter {};
