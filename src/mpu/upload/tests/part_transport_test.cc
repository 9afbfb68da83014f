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

#include "test_utils/test.h"
#include "upload/errors.h"
#include "upload/part_transport.h"
#include "upload/tests/test_helpers.h"

#include <seastar/core/abort_source.hh>
#include <seastar/coroutine/as_future.hh>

#include <gtest/gtest.h>

#include <stdexcept>

using namespace mpu;
using namespace mpu::test;
using namespace std::chrono_literals;

namespace {

ss::temporary_buffer<char> bytes_of(std::string_view s) {
    return ss::temporary_buffer<char>(s.data(), s.size());
}

retry_options quick_retries(int attempts, int* backoffs = nullptr) {
    retry_options opts{
      .max_attempts = attempts,
      .policy = retry_policy{
        .base_delay = 1ms,
        .backoff_multiplier = 2.0,
        .max_delay = 4ms,
        .max_jitter = 0ms}};
    if (backoffs != nullptr) {
        opts.on_backoff = [backoffs](int, std::chrono::milliseconds) {
            ++*backoffs;
        };
    }
    return opts;
}

part_upload_request part_request(int n, std::string_view body = "payload") {
    return part_upload_request{
      .url = part_url(n), .part_number = n, .bytes = bytes_of(body)};
}

} // namespace

TEST_CORO(UploadPart, ReturnsEtagAndSendsHeadersVerbatim) {
    fake_http_client client([](const recorded_request&, ss::abort_source*) {
        return ready(make_response(200, "", "\"abc123\""));
    });
    auto req = part_request(4);
    req.headers.emplace("x-amz-server-side-encryption", "aws:kms");
    req.headers.emplace("Content-MD5", "q1w2e3==");

    auto uploaded = co_await upload_part(client, std::move(req));

    EXPECT_EQ(uploaded.part_number, 4);
    // Quotes are part of the tag and are kept.
    EXPECT_EQ(uploaded.etag, "\"abc123\"");
    ASSERT_EQ_CORO(client.requests.size(), 1u);
    const auto& sent = client.requests[0];
    EXPECT_EQ(sent.method, "PUT");
    EXPECT_EQ(sent.url, part_url(4));
    EXPECT_EQ(sent.body, "payload");
    EXPECT_EQ(sent.header("x-amz-server-side-encryption"), "aws:kms");
    EXPECT_EQ(sent.header("Content-MD5"), "q1w2e3==");
}

TEST_CORO(UploadPart, RetriesServerFaultsUntilSuccess) {
    int calls = 0;
    int backoffs = 0;
    fake_http_client client(
      [&calls](const recorded_request&, ss::abort_source*) {
          ++calls;
          if (calls < 3) {
              return ready(make_response(500, "internal"));
          }
          return ready(make_response(200, "", "etag-7"));
      });

    auto uploaded = co_await upload_part(
      client, part_request(7), quick_retries(3, &backoffs));

    EXPECT_EQ(uploaded.etag, "etag-7");
    EXPECT_EQ(calls, 3);
    EXPECT_EQ(backoffs, 2);
}

TEST_CORO(UploadPart, MissingEtagIsNotRetried) {
    fake_http_client client([](const recorded_request&, ss::abort_source*) {
        return ready(make_response(200));
    });

    auto fut = co_await ss::coroutine::as_future(
      upload_part(client, part_request(2), quick_retries(5)));

    ASSERT_TRUE_CORO(fut.failed());
    auto err = as_upload_error(fut.get_exception());
    EXPECT_EQ(err.code(), errc::missing_etag);
    EXPECT_EQ(err.part_number(), 2);
    EXPECT_EQ(err.stage(), upload_stage::uploading);
    EXPECT_FALSE(err.retryable());
    EXPECT_EQ(client.requests.size(), 1u);
}

TEST_CORO(UploadPart, ExhaustedStatusFailureCarriesStatusAndPart) {
    int backoffs = 0;
    fake_http_client client([](const recorded_request&, ss::abort_source*) {
        return ready(make_response(503, "slow down"));
    });

    auto fut = co_await ss::coroutine::as_future(
      upload_part(client, part_request(3), quick_retries(2, &backoffs)));

    ASSERT_TRUE_CORO(fut.failed());
    auto err = as_upload_error(fut.get_exception());
    EXPECT_EQ(err.code(), errc::transport_error);
    EXPECT_EQ(err.kind(), error_class::transport);
    EXPECT_EQ(err.http_status(), 503);
    EXPECT_EQ(err.part_number(), 3);
    EXPECT_EQ(client.requests.size(), 2u);
    EXPECT_EQ(backoffs, 1);
}

TEST_CORO(UploadPart, ConnectionFailuresAreRetried) {
    int calls = 0;
    fake_http_client client(
      [&calls](const recorded_request&, ss::abort_source*) {
          if (++calls == 1) {
              return ss::make_exception_future<http::response>(
                std::system_error(
                  std::make_error_code(std::errc::connection_reset)));
          }
          return ready(make_response(200, "", "e"));
      });

    auto uploaded = co_await upload_part(
      client, part_request(1), quick_retries(2));

    EXPECT_EQ(uploaded.etag, "e");
    EXPECT_EQ(calls, 2);
}

TEST_CORO(UploadPart, SingleAttemptByDefault) {
    fake_http_client client([](const recorded_request&, ss::abort_source*) {
        return ready(make_response(500));
    });

    auto fut = co_await ss::coroutine::as_future(
      upload_part(client, part_request(1)));

    ASSERT_TRUE_CORO(fut.failed());
    fut.ignore_ready_future();
    EXPECT_EQ(client.requests.size(), 1u);
}

TEST_CORO(UploadPart, CancellationIsReportedAsCancelled) {
    ss::abort_source as;
    fake_http_client client([&as](const recorded_request&, ss::abort_source*) {
        as.request_abort();
        return ready(make_response(500));
    });
    auto req = part_request(5);
    req.as = &as;

    auto fut = co_await ss::coroutine::as_future(
      upload_part(client, std::move(req), quick_retries(4)));

    ASSERT_TRUE_CORO(fut.failed());
    auto err = as_upload_error(fut.get_exception());
    EXPECT_EQ(err.code(), errc::cancelled);
    EXPECT_EQ(err.kind(), error_class::cancellation);
    EXPECT_EQ(client.requests.size(), 1u);
}

TEST_CORO(UploadPart, ProgressNeverDecreasesAcrossAttempts) {
    int calls = 0;
    fake_http_client client(
      [&calls](const recorded_request&, ss::abort_source*) {
          if (++calls == 1) {
              return ready(make_response(502));
          }
          return ready(make_response(200, "", "ok"));
      });
    std::vector<size_t> seen;
    auto req = part_request(1, "0123456789");
    req.on_progress = [&seen](size_t n) { seen.push_back(n); };

    co_await upload_part(client, std::move(req), quick_retries(2));

    // The second attempt reports 5 and 10 again; neither is below 10.
    std::vector<size_t> expected{5, 10};
    EXPECT_EQ(seen, expected);
}

TEST_CORO(UploadObject, DefaultsContentType) {
    fake_http_client client([](const recorded_request&, ss::abort_source*) {
        return ready(make_response(201, "", "whole"));
    });

    auto result = co_await upload_object(
      client,
      object_upload_request{
        .url = "https://bucket.example.com/object", .bytes = bytes_of("abc")});

    EXPECT_EQ(result.status, 201);
    EXPECT_EQ(result.etag, "whole");
    ASSERT_EQ_CORO(client.requests.size(), 1u);
    EXPECT_EQ(
      client.requests[0].header("Content-Type"), "application/octet-stream");
}

TEST_CORO(UploadObject, KeepsCallerContentType) {
    fake_http_client client([](const recorded_request&, ss::abort_source*) {
        return ready(make_response(200));
    });
    object_upload_request req{
      .url = "https://bucket.example.com/object", .bytes = bytes_of("abc")};
    req.headers.emplace("content-type", "text/plain");

    auto result = co_await upload_object(client, std::move(req));

    EXPECT_FALSE(result.etag.has_value());
    ASSERT_EQ_CORO(client.requests.size(), 1u);
    EXPECT_EQ(client.requests[0].header("Content-Type"), "text/plain");
}
