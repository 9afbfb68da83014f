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

#include "config/configuration.h"

#include <gtest/gtest.h>
#include <yaml-cpp/yaml.h>

#include <stdexcept>

using namespace mpu;
using namespace std::chrono_literals;

TEST(ClientConfiguration, MinimalDocumentUsesDefaults) {
    auto cfg = client_configuration::load(R"(
mpu:
  endpoint: https://storage.example.com/api
)");
    EXPECT_EQ(cfg.control.endpoint, "https://storage.example.com/api");
    EXPECT_EQ(cfg.control.create_path, "/multipart/create");
    EXPECT_EQ(cfg.control.abort_path, "/multipart/abort");
    EXPECT_EQ(cfg.part_size, default_part_size);
    EXPECT_EQ(cfg.concurrency, default_concurrency);
    EXPECT_EQ(cfg.presign_batch_size, default_presign_batch_size);
    EXPECT_EQ(cfg.policy, retry_policy::defaults());
    EXPECT_EQ(cfg.control.max_attempts, 1);
    EXPECT_FALSE(cfg.encryption.has_value());
    EXPECT_FALSE(cfg.ca_file.has_value());

    auto upload = cfg.make_multipart_config();
    EXPECT_EQ(upload.max_attempts, 1);
    EXPECT_EQ(upload.abort_timeout, 5000ms);
}

TEST(ClientConfiguration, FullDocument) {
    auto cfg = client_configuration::load(R"(
mpu:
  endpoint: https://storage.example.com/api
  create_path: /mpu/start
  headers:
    Authorization: Bearer abc
    X-Tenant: acme
  part_size: 5242880
  concurrency: 8
  presign_batch_size: 25
  retry: 5
  retry_policy:
    base_delay_ms: 100
    backoff_multiplier: 1.5
    max_delay_ms: 2000
    max_jitter_ms: 0
  control_retry_attempts: 3
  abort_timeout_ms: 750
  encryption:
    type: SSE-KMS
    key_id: alias/uploads
  ca_file: /etc/ssl/ca.pem
)");
    EXPECT_EQ(cfg.control.create_path, "/mpu/start");
    EXPECT_EQ(cfg.control.headers.size(), 2u);
    EXPECT_EQ(cfg.control.headers.at("X-Tenant"), "acme");
    EXPECT_EQ(cfg.part_size, 5242880);
    EXPECT_EQ(cfg.concurrency, 8);
    EXPECT_EQ(cfg.presign_batch_size, 25);
    EXPECT_EQ(cfg.control.max_attempts, 3);
    EXPECT_EQ(cfg.control.retry.base_delay, 100ms);
    EXPECT_DOUBLE_EQ(cfg.policy.backoff_multiplier, 1.5);
    EXPECT_EQ(cfg.policy.max_delay, 2000ms);
    EXPECT_EQ(cfg.policy.max_jitter, 0ms);
    EXPECT_EQ(cfg.abort_timeout, 750ms);
    EXPECT_EQ(cfg.encryption, encryption::sse_kms("alias/uploads"));
    EXPECT_EQ(cfg.ca_file, "/etc/ssl/ca.pem");

    auto upload = cfg.make_multipart_config();
    EXPECT_EQ(upload.max_attempts, 5);
    EXPECT_EQ(upload.part_size, 5242880);
    EXPECT_EQ(upload.retry, cfg.policy);
}

TEST(ClientConfiguration, RetrySwitch) {
    auto attempts = [](std::string_view value) {
        auto cfg = client_configuration::load(
          std::string("mpu:\n  endpoint: http://h\n  retry: ")
          + std::string(value) + "\n");
        return cfg.make_multipart_config().max_attempts;
    };
    EXPECT_EQ(attempts("true"), default_retry_attempts);
    EXPECT_EQ(attempts("false"), 1);
    EXPECT_EQ(attempts("~"), 1);
    EXPECT_EQ(attempts("4"), 4);
    EXPECT_EQ(attempts("0"), 1);
}

TEST(ClientConfiguration, CustomerKeyEncryption) {
    auto cfg = client_configuration::load(R"(
mpu:
  endpoint: http://h
  encryption:
    type: SSE-C
    customer_key: a2V5
    customer_key_md5: bWQ1
)");
    ASSERT_TRUE(cfg.encryption.has_value());
    EXPECT_EQ(cfg.encryption->type, encryption::kind::sse_c);
    EXPECT_EQ(cfg.encryption->customer_key, "a2V5");
    EXPECT_EQ(cfg.encryption->customer_key_md5, "bWQ1");
    EXPECT_EQ(cfg.encryption->algorithm, "AES256");
}

TEST(ClientConfiguration, RejectsIncompleteDocuments) {
    EXPECT_THROW(client_configuration::load("other: 1\n"), std::invalid_argument);
    EXPECT_THROW(
      client_configuration::load("mpu:\n  part_size: 10\n"),
      std::invalid_argument);
    EXPECT_THROW(
      client_configuration::load(
        "mpu:\n  endpoint: http://h\n  encryption: {type: SSE-X}\n"),
      YAML::Exception);
    EXPECT_THROW(
      client_configuration::load(
        "mpu:\n  endpoint: http://h\n  concurrency: many\n"),
      YAML::Exception);
}

TEST(ClientConfiguration, PrintingRedactsHeaders) {
    auto cfg = client_configuration::load(R"(
mpu:
  endpoint: http://h
  headers: {Authorization: Bearer secret}
)");
    auto text = fmt::format("{}", cfg);
    EXPECT_EQ(text.find("secret"), std::string::npos);
    EXPECT_NE(text.find("http://h"), std::string::npos);
}
