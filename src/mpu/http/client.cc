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

#include "http/client.h"

#include "base/units.h"
#include "base/vlog.h"
#include "http/logger.h"

#include <seastar/core/coroutine.hh>
#include <seastar/core/do_with.hh>
#include <seastar/core/iostream.hh>
#include <seastar/http/reply.hh>
#include <seastar/http/request.hh>
#include <seastar/net/dns.hh>
#include <seastar/net/inet_address.hh>
#include <seastar/util/short_streams.hh>

#include <fmt/ostream.h>

#include <algorithm>
#include <ostream>

namespace mpu::http {

namespace {

// Granularity of progress reports while streaming a request body.
constexpr size_t progress_chunk_size = 64_KiB;

ss::sstring to_sstring(boost::beast::string_view v) {
    return {v.data(), v.size()};
}

ss::future<> write_body(
  ss::output_stream<char> out,
  ss::temporary_buffer<char> body,
  progress_callback on_progress) {
    std::exception_ptr err;
    try {
        size_t written = 0;
        while (written < body.size()) {
            auto n = std::min(progress_chunk_size, body.size() - written);
            co_await out.write(body.get() + written, n);
            co_await out.flush();
            written += n;
            if (on_progress) {
                on_progress(written);
            }
        }
    } catch (...) {
        err = std::current_exception();
    }
    co_await out.close();
    if (err) {
        std::rethrow_exception(err);
    }
}

} // namespace

std::optional<ss::sstring> response::header(std::string_view name) const {
    auto it = headers.find(as_beast(name));
    if (it == headers.end()) {
        return std::nullopt;
    }
    return to_sstring(it->value());
}

std::ostream& operator<<(std::ostream& o, const request& r) {
    fmt::print(
      o,
      "{{{} {}, body: {} bytes}}",
      r.method,
      without_query(r.url),
      r.body.size());
    return o;
}

client::client(configuration cfg)
  : _cfg(std::move(cfg)) {}

ss::future<ss::shared_ptr<ss::tls::certificate_credentials>>
client::credentials() {
    if (!_creds) {
        ss::tls::credentials_builder builder;
        builder.set_client_auth(ss::tls::client_auth::NONE);
        if (_cfg.ca_file) {
            co_await builder.set_x509_trust_file(
              *_cfg.ca_file, ss::tls::x509_crt_format::PEM);
        } else {
            co_await builder.set_system_trust();
        }
        _creds = builder.build_certificate_credentials();
    }
    co_return _creds;
}

ss::future<client::pool_t*> client::pool_for(const url_parts& url) {
    auto key = fmt::format("{}://{}:{}", url.scheme, url.host, url.port);
    if (auto it = _pools.find(key); it != _pools.end()) {
        co_return it->second.get();
    }
    auto addr = co_await ss::net::dns::resolve_name(url.host);
    ss::shared_ptr<ss::tls::certificate_credentials> creds;
    if (url.is_tls()) {
        creds = co_await credentials();
    }
    // Another fiber may have created the pool while we were resolving.
    if (auto it = _pools.find(key); it != _pools.end()) {
        co_return it->second.get();
    }
    mlog(http_log.debug, "Opening connection pool to {}", key);
    std::unique_ptr<pool_t> pool;
    if (creds) {
        pool = std::make_unique<pool_t>(
          ss::socket_address(addr, url.port), std::move(creds), url.host);
    } else {
        pool = std::make_unique<pool_t>(ss::socket_address(addr, url.port));
    }
    auto [it, _] = _pools.emplace(std::move(key), std::move(pool));
    co_return it->second.get();
}

ss::future<response>
client::send(request req, ss::abort_source* as, progress_callback on_progress) {
    auto holder = _gate.hold();
    auto url = parse_url(req.url);
    auto* pool = co_await pool_for(url);

    mlog(http_log.trace, "Sending {}", req);
    auto out = ss::http::request::make(req.method, url.authority(), url.target);
    auto len = req.body.size();
    out.write_body(
      "bin",
      len,
      [body = std::move(req.body), cb = std::move(on_progress)](
        ss::output_stream<char>&& stream) mutable {
          return write_body(std::move(stream), std::move(body), std::move(cb));
      });
    // Headers are sent exactly as given, including the content type.
    out._headers.erase("Content-Type");
    for (const auto& field : req.headers) {
        out._headers[to_sstring(field.name_string())] = to_sstring(
          field.value());
    }

    response resp;
    co_await pool->make_request(
      std::move(out),
      [&resp](const ss::http::reply& rep, ss::input_stream<char>&& body) {
          resp.status = static_cast<int>(rep._status);
          for (const auto& [name, value] : rep._headers) {
              resp.headers.insert(as_beast(name), as_beast(value));
          }
          return ss::do_with(
            std::move(body), [&resp](ss::input_stream<char>& in) {
                return ss::util::read_entire_stream_contiguous(in).then(
                  [&resp](ss::sstring b) { resp.body = std::move(b); });
            });
      },
      std::nullopt,
      as);
    mlog(
      http_log.trace,
      "{} {} returned {} ({} bytes)",
      req.method,
      url,
      resp.status,
      resp.body.size());
    co_return resp;
}

ss::future<> client::stop() {
    co_await _gate.close();
    for (auto& [key, pool] : _pools) {
        mlog(http_log.debug, "Closing connection pool to {}", key);
        co_await pool->close();
    }
    _pools.clear();
}

} // namespace mpu::http
