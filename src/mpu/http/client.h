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
#include "http/types.h"
#include "http/url.h"

#include <seastar/core/abort_source.hh>
#include <seastar/core/future.hh>
#include <seastar/core/gate.hh>
#include <seastar/core/shared_ptr.hh>
#include <seastar/http/client.hh>
#include <seastar/net/tls.hh>

#include <absl/container/flat_hash_map.h>

#include <memory>
#include <string>

namespace mpu::http {

/// Interface to allow testing the upload paths with fake transports.
class abstract_client {
public:
    abstract_client() = default;
    abstract_client(const abstract_client&) = delete;
    abstract_client& operator=(const abstract_client&) = delete;
    abstract_client(abstract_client&&) = delete;
    abstract_client& operator=(abstract_client&&) = delete;
    virtual ~abstract_client() = default;

    /// \brief Perform a single request and collect the whole response
    ///
    /// Any status code is returned as a response; only connection level
    /// failures are raised as exceptions.
    ///
    /// \param req request to send, the body is consumed
    /// \param as optional abort source, firing it tears down the request
    /// \param on_progress receives cumulative body bytes written
    virtual ss::future<response>
    send(request req, ss::abort_source* as, progress_callback on_progress)
      = 0;

    virtual ss::future<> stop() = 0;
};

/// Client on top of the seastar http client. One connection pool is kept per
/// scheme://host:port, created lazily on first use.
class client final : public abstract_client {
public:
    struct configuration {
        /// Trust file for https endpoints; system trust when empty.
        std::optional<ss::sstring> ca_file;
    };

    explicit client(configuration cfg);

    ss::future<response> send(
      request req, ss::abort_source* as, progress_callback on_progress) final;

    /// Stop must be called before destroying the client object.
    ss::future<> stop() final;

private:
    using pool_t = ss::http::experimental::client;

    ss::future<pool_t*> pool_for(const url_parts& url);
    ss::future<ss::shared_ptr<ss::tls::certificate_credentials>> credentials();

    configuration _cfg;
    ss::shared_ptr<ss::tls::certificate_credentials> _creds;
    absl::flat_hash_map<std::string, std::unique_ptr<pool_t>> _pools;
    ss::gate _gate;
};

} // namespace mpu::http
