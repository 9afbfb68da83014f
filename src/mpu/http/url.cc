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

#include "http/url.h"

#include <seastar/core/print.hh>

#include <absl/strings/str_cat.h>
#include <ada.h>
#include <fmt/format.h>
#include <fmt/ostream.h>

#include <ostream>
#include <stdexcept>

namespace mpu::http {

ss::sstring url_parts::authority() const {
    auto default_port = is_tls() ? 443 : 80;
    if (port == default_port) {
        return host;
    }
    return ss::format("{}:{}", host, port);
}

std::ostream& operator<<(std::ostream& o, const url_parts& u) {
    fmt::print(
      o, "{}://{}{}", u.scheme, u.authority(), without_query(u.target));
    return o;
}

url_parts parse_url(std::string_view url) {
    auto parsed = ada::parse<ada::url>(url);
    if (!parsed) {
        throw std::invalid_argument(fmt::format("invalid URL: {}", url));
    }
    auto protocol = parsed->get_protocol();
    if (protocol != "http:" && protocol != "https:") {
        throw std::invalid_argument(
          fmt::format("unsupported URL scheme {} in {}", protocol, url));
    }
    auto hostname = parsed->get_hostname();
    if (hostname.empty()) {
        throw std::invalid_argument(fmt::format("URL has no host: {}", url));
    }
    url_parts out;
    out.scheme = ss::sstring(protocol.substr(0, protocol.size() - 1));
    out.host = ss::sstring(hostname);
    out.port = parsed->port.value_or(
      static_cast<uint16_t>(parsed->scheme_default_port()));
    auto target = absl::StrCat(parsed->get_pathname(), parsed->get_search());
    out.target = target.empty() ? ss::sstring("/") : ss::sstring(target);
    return out;
}

std::string_view without_query(std::string_view url) {
    return url.substr(0, url.find('?'));
}

ss::sstring join_url(std::string_view base, std::string_view path) {
    if (path.empty()) {
        return {base.data(), base.size()};
    }
    if (base.ends_with('/') && path.starts_with('/')) {
        base.remove_suffix(1);
    } else if (!base.ends_with('/') && !path.starts_with('/')) {
        return ss::sstring(absl::StrCat(base, "/", path));
    }
    return ss::sstring(absl::StrCat(base, path));
}

} // namespace mpu::http
