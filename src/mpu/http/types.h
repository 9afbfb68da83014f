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
#include <seastar/core/temporary_buffer.hh>
#include <seastar/util/noncopyable_function.hh>

#include <boost/beast/http/fields.hpp>
#include <fmt/ostream.h>

#include <cstddef>
#include <iosfwd>
#include <optional>
#include <string_view>

namespace mpu::http {

/// Header collection with case-insensitive lookup. Insertion order and the
/// caller's spelling of names are preserved when a request is written.
using header_fields = boost::beast::http::fields;

/// Beast has its own string_view type, it is not std::string_view on every
/// Boost release.
inline boost::beast::string_view as_beast(std::string_view v) {
    return {v.data(), v.size()};
}

/// Receives the cumulative number of body bytes written so far.
using progress_callback = ss::noncopyable_function<void(size_t)>;

struct request {
    ss::sstring method;
    ss::sstring url;
    header_fields headers;
    ss::temporary_buffer<char> body;

    void set_header(std::string_view name, std::string_view value) {
        headers.set(as_beast(name), as_beast(value));
    }
};

struct response {
    int status{0};
    header_fields headers;
    ss::sstring body;

    bool is_success() const { return status >= 200 && status < 300; }

    /// Case-insensitive header lookup.
    std::optional<ss::sstring> header(std::string_view name) const;
};

/// Query strings are left out, presigned URLs carry their signature there.
std::ostream& operator<<(std::ostream&, const request&);

} // namespace mpu::http

template<>
struct fmt::formatter<mpu::http::request> : fmt::ostream_formatter {};
