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
#include "upload/control_channel.h"
#include "upload/errors.h"
#include "upload/http_control_channel.h"
#include "upload/tests/test_helpers.h"

#include <seastar/coroutine/as_future.hh>

#include <gtest/gtest.h>

using namespace mpu;
using namespace mpu::test;
using namespace std::chrono_literals;

namespace {

std::vector<presigned_part> answer_for(std::initializer_list<int> numbers) {
    std::vector<presigned_part> out;
    for (auto n : numbers) {
        out.push_back(presigned_part{.part_number = n, .url = part_url(n)});
    }
    return out;
}

upload_error validation_failure(
  const std::vector<int>& requested,
  const std::vector<presigned_part>& answer,
  size_t part_count) {
    try {
        validate_presigned_batch(requested, answer, part_count);
    } catch (...) {
        return as_upload_error(std::current_exception());
    }
    throw std::logic_error("batch was accepted");
}

control_endpoints endpoints(int max_attempts = 1) {
    control_endpoints cfg{.endpoint = "https://api.example.com/v1/"};
    cfg.headers.emplace("Authorization", "Bearer t0ken");
    cfg.max_attempts = max_attempts;
    cfg.retry = retry_policy{
      .base_delay = 1ms,
      .backoff_multiplier = 1.0,
      .max_delay = 1ms,
      .max_jitter = 0ms};
    return cfg;
}

const session test_session{.key = "obj", .upload_id = "u-9"};

constexpr std::string_view quota_error = R"({"origin":"storage",)"
                                         R"("code":"QuotaExceeded",)"
                                         R"("message":"bucket is full",)"
                                         R"("details":{"limit":10}})";

} // namespace

TEST(ValidatePresignedBatch, AcceptsAnyOrder) {
    EXPECT_NO_THROW(validate_presigned_batch({3, 4, 5}, answer_for({5, 3, 4}), 5));
}

TEST(ValidatePresignedBatch, NumberWithoutByteRange) {
    auto err = validation_failure({1, 2}, answer_for({1, 7}), 2);
    EXPECT_EQ(err.code(), errc::invalid_parts);
    EXPECT_EQ(err.part_number(), 7);
}

TEST(ValidatePresignedBatch, UnrequestedNumber) {
    auto err = validation_failure({1}, answer_for({2}), 3);
    EXPECT_EQ(err.code(), errc::invalid_presign_response);
}

TEST(ValidatePresignedBatch, RepeatedNumber) {
    auto err = validation_failure({1, 2}, answer_for({1, 1, 2}), 3);
    EXPECT_EQ(err.code(), errc::invalid_presign_response);
}

TEST(ValidatePresignedBatch, MissingNumber) {
    auto err = validation_failure({1, 2, 3}, answer_for({1, 3}), 3);
    EXPECT_EQ(err.code(), errc::invalid_presign_response);
    EXPECT_EQ(err.stage(), upload_stage::presigning);
}

TEST_CORO(HttpControlChannel, CreatePostsJsonWithConfiguredHeaders) {
    fake_http_client client([](const recorded_request&, ss::abort_source*) {
        return ready(make_response(200, R"({"uploadId":"u-1","key":"k"})"));
    });
    http_control_channel channel(client, endpoints());

    auto s = co_await channel.create(
      source_descriptor{.name = "a", .size = 3, .content_type = "text/plain"},
      R"({"x":1})",
      std::nullopt,
      nullptr);

    EXPECT_EQ(s.upload_id, "u-1");
    EXPECT_EQ(s.key, "k");
    ASSERT_EQ_CORO(client.requests.size(), 1u);
    const auto& req = client.requests[0];
    EXPECT_EQ(req.method, "POST");
    EXPECT_EQ(req.url, "https://api.example.com/v1/multipart/create");
    EXPECT_EQ(req.header("Authorization"), "Bearer t0ken");
    EXPECT_EQ(req.header("Content-Type"), "application/json");
    EXPECT_EQ(
      req.body,
      R"({"sourceDescriptor":{"name":"a","size":3,"contentType":"text/plain"},)"
      R"("metadata":{"x":1}})");
}

TEST_CORO(HttpControlChannel, ErrorPayloadBecomesServerError) {
    fake_http_client client([](const recorded_request&, ss::abort_source*) {
        return ready(make_response(507, ss::sstring(quota_error)));
    });
    http_control_channel channel(client, endpoints(3));

    auto fut = co_await ss::coroutine::as_future(
      channel.create({.name = "a", .size = 1}, "", std::nullopt, nullptr));

    ASSERT_TRUE_CORO(fut.failed());
    auto ex = fut.get_exception();
    try {
        std::rethrow_exception(ex);
    } catch (const server_error& e) {
        EXPECT_EQ(e.code(), errc::server_error);
        EXPECT_EQ(e.kind(), error_class::server);
        EXPECT_EQ(e.stage(), upload_stage::creating);
        EXPECT_EQ(e.http_status(), 507);
        EXPECT_EQ(e.server_payload().origin, "storage");
        EXPECT_EQ(e.server_code(), "QuotaExceeded");
        EXPECT_EQ(e.server_payload().details, R"({"limit":10})");
    } catch (const std::exception& e) {
        ADD_FAILURE() << "unexpected exception: " << e.what();
    }
    // create is never retried.
    EXPECT_EQ(client.requests.size(), 1u);
}

TEST_CORO(HttpControlChannel, UnstructuredFailureIsTransportError) {
    fake_http_client client([](const recorded_request&, ss::abort_source*) {
        return ready(make_response(502, "<html>bad gateway</html>"));
    });
    http_control_channel channel(client, endpoints());

    auto fut = co_await ss::coroutine::as_future(
      channel.abort(test_session, nullptr));

    ASSERT_TRUE_CORO(fut.failed());
    auto err = as_upload_error(fut.get_exception());
    EXPECT_EQ(err.code(), errc::transport_error);
    EXPECT_EQ(err.http_status(), 502);
    EXPECT_EQ(err.stage(), upload_stage::aborting);
    ASSERT_EQ_CORO(client.requests.size(), 1u);
    EXPECT_EQ(client.requests[0].url, "https://api.example.com/v1/multipart/abort");
    EXPECT_EQ(client.requests[0].body, R"({"key":"obj","uploadId":"u-9"})");
}

TEST_CORO(HttpControlChannel, PresignRetriesThrottling) {
    int calls = 0;
    fake_http_client client(
      [&calls](const recorded_request&, ss::abort_source*) {
          if (++calls == 1) {
              return ready(make_response(
                429, R"({"code":"SlowDown","message":"throttled"})"));
          }
          return ready(make_response(
            200,
            R"({"parts":[{"partNumber":1,"presignedUrl":"https://h/1"}]})"));
      });
    http_control_channel channel(client, endpoints(2));

    auto parts = co_await channel.presign_parts(
      test_session, {1}, std::nullopt, nullptr);

    ASSERT_EQ_CORO(parts.size(), 1u);
    EXPECT_EQ(parts[0].url, "https://h/1");
    EXPECT_EQ(calls, 2);
    EXPECT_EQ(
      client.requests[1].url,
      "https://api.example.com/v1/multipart/presign-parts");
}

TEST_CORO(HttpControlChannel, ClientErrorsAreNotRetried) {
    fake_http_client client([](const recorded_request&, ss::abort_source*) {
        return ready(
          make_response(403, R"({"code":"Denied","message":"no access"})"));
    });
    http_control_channel channel(client, endpoints(4));

    auto fut = co_await ss::coroutine::as_future(
      channel.presign_parts(test_session, {1}, std::nullopt, nullptr));

    ASSERT_TRUE_CORO(fut.failed());
    auto err = as_upload_error(fut.get_exception());
    EXPECT_EQ(err.code(), errc::server_error);
    EXPECT_FALSE(err.retryable());
    EXPECT_EQ(client.requests.size(), 1u);
}

TEST_CORO(HttpControlChannel, CompleteKeepsSessionKeyWhenResponseHasNone) {
    fake_http_client client([](const recorded_request&, ss::abort_source*) {
        return ready(make_response(200, "{}"));
    });
    http_control_channel channel(client, endpoints());

    auto key = co_await channel.complete(
      test_session, {{.part_number = 1, .etag = "e1"}}, nullptr);

    EXPECT_EQ(key, "obj");
    ASSERT_EQ_CORO(client.requests.size(), 1u);
    EXPECT_EQ(
      client.requests[0].body,
      R"({"key":"obj","uploadId":"u-9","parts":[{"partNumber":1,"eTag":"e1"}]})");
}

TEST_CORO(HttpControlChannel, CompleteReturnsServerKey) {
    fake_http_client client([](const recorded_request&, ss::abort_source*) {
        return ready(make_response(200, R"({"key":"renamed"})"));
    });
    http_control_channel channel(client, endpoints());

    auto key = co_await channel.complete(
      test_session, {{.part_number = 1, .etag = "e1"}}, nullptr);

    EXPECT_EQ(key, "renamed");
}
