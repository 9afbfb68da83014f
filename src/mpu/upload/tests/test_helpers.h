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
#include "http/client.h"
#include "upload/control_channel.h"
#include "upload/errors.h"
#include "upload/types.h"

#include <seastar/core/future.hh>
#include <seastar/core/print.hh>
#include <seastar/core/sstring.hh>

#include <gmock/gmock.h>

#include <exception>
#include <functional>
#include <ostream>
#include <vector>

namespace seastar {
// Print seastar strings in gmock error messages
template<typename Ch, typename Size, Size max_size, bool null_terminate>
void PrintTo(
  const basic_sstring<Ch, Size, max_size, null_terminate>& s, std::ostream* o) {
    *o << s;
}
} // namespace seastar

namespace mpu::test {

/// Request as seen by fake_http_client, with the body copied out.
struct recorded_request {
    ss::sstring method;
    ss::sstring url;
    http::header_fields headers;
    ss::sstring body;

    std::optional<ss::sstring> header(std::string_view name) const {
        auto it = headers.find(http::as_beast(name));
        if (it == headers.end()) {
            return std::nullopt;
        }
        return ss::sstring(it->value().data(), it->value().size());
    }
};

/// Transport double: records every request and answers through a handler.
/// Progress is reported in two steps, half of the body and then all of it.
class fake_http_client final : public http::abstract_client {
public:
    using handler_t = std::function<ss::future<http::response>(
      const recorded_request&, ss::abort_source*)>;

    explicit fake_http_client(handler_t h)
      : _handler(std::move(h)) {}

    ss::future<http::response> send(
      http::request req,
      ss::abort_source* as,
      http::progress_callback on_progress) final {
        recorded_request rec{
          .method = req.method,
          .url = req.url,
          .headers = req.headers,
          .body = ss::sstring(req.body.get(), req.body.size())};
        requests.push_back(rec);
        if (on_progress && !req.body.empty()) {
            on_progress(req.body.size() / 2);
            on_progress(req.body.size());
        }
        return _handler(requests.back(), as);
    }

    ss::future<> stop() final { return ss::make_ready_future<>(); }

    std::vector<recorded_request> requests;

private:
    handler_t _handler;
};

inline http::response make_response(
  int status, ss::sstring body = "", std::optional<ss::sstring> etag = {}) {
    http::response r;
    r.status = status;
    r.body = std::move(body);
    if (etag) {
        r.headers.set("ETag", http::as_beast(*etag));
    }
    return r;
}

inline ss::future<http::response> ready(http::response r) {
    return ss::make_ready_future<http::response>(std::move(r));
}

class mock_control_channel : public control_channel {
public:
    MOCK_METHOD(
      ss::future<session>,
      create,
      (const source_descriptor&,
       const ss::sstring&,
       const std::optional<encryption>&,
       ss::abort_source*),
      (override));

    MOCK_METHOD(
      ss::future<std::vector<presigned_part>>,
      presign_parts,
      (const session&,
       const std::vector<int>&,
       const std::optional<encryption>&,
       ss::abort_source*),
      (override));

    MOCK_METHOD(
      ss::future<ss::sstring>,
      complete,
      (const session&, const std::vector<uploaded_part>&, ss::abort_source*),
      (override));

    MOCK_METHOD(
      ss::future<>, abort, (const session&, ss::abort_source*), (override));
};

inline ss::sstring part_url(int n) {
    return ss::format("https://bucket.example.com/object?partNumber={}", n);
}

/// presign_parts action answering every requested number.
inline auto presign_requested() {
    return [](
             const session&,
             const std::vector<int>& numbers,
             const std::optional<encryption>&,
             ss::abort_source*) {
        std::vector<presigned_part> out;
        for (auto n : numbers) {
            out.push_back(presigned_part{.part_number = n, .url = part_url(n)});
        }
        return ss::make_ready_future<std::vector<presigned_part>>(
          std::move(out));
    };
}

/// Rethrows \p e, expecting an upload_error, and returns a copy of it.
inline upload_error as_upload_error(const std::exception_ptr& e) {
    try {
        std::rethrow_exception(e);
    } catch (const upload_error& err) {
        return err;
    }
}

} // namespace mpu::test
