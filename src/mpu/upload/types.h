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
#include "base/units.h"
#include "utils/retry.h"

#include <seastar/core/abort_source.hh>
#include <seastar/core/sstring.hh>
#include <seastar/util/noncopyable_function.hh>

#include <absl/container/btree_map.h>
#include <fmt/ostream.h>

#include <chrono>
#include <cstdint>
#include <iosfwd>
#include <optional>

namespace mpu {

constexpr int64_t default_part_size = 10_MiB;
constexpr int default_concurrency = 4;
constexpr int default_presign_batch_size = 10;
constexpr auto default_content_type = "application/octet-stream";

/// Lifecycle of one multipart upload. aborting is entered at most once, from
/// any stage after creating succeeded.
enum class upload_stage {
    validating,
    creating,
    splitting,
    presigning,
    uploading,
    completing,
    aborting,
    done,
    failed,
};

std::ostream& operator<<(std::ostream&, upload_stage);

/// A contiguous byte range [start, end) of the source.
struct part {
    int part_number{0};
    uint64_t start{0};
    uint64_t end{0};

    uint64_t size() const { return end - start; }

    bool operator==(const part&) const = default;
    friend std::ostream& operator<<(std::ostream&, const part&);
};

struct session {
    ss::sstring key;
    ss::sstring upload_id;

    bool operator==(const session&) const = default;
    friend std::ostream& operator<<(std::ostream&, const session&);
};

using header_map = absl::btree_map<ss::sstring, ss::sstring>;

struct presigned_part {
    int part_number{0};
    ss::sstring url;
    /// Attached verbatim to the part PUT (e.g. encryption parameters).
    header_map upload_headers;

    bool operator==(const presigned_part&) const = default;
    friend std::ostream& operator<<(std::ostream&, const presigned_part&);
};

struct uploaded_part {
    int part_number{0};
    ss::sstring etag;

    bool operator==(const uploaded_part&) const = default;
    friend std::ostream& operator<<(std::ostream&, const uploaded_part&);
};

struct source_descriptor {
    ss::sstring name;
    uint64_t size{0};
    ss::sstring content_type;

    bool operator==(const source_descriptor&) const = default;
    friend std::ostream& operator<<(std::ostream&, const source_descriptor&);
};

/// Server side encryption requested for the object.
struct encryption {
    enum class kind { sse_s3, sse_kms, sse_c };

    kind type{kind::sse_s3};
    /// SSE-KMS key, the bucket default key when unset.
    std::optional<ss::sstring> key_id;
    /// SSE-C key material (base64) and its optional digest.
    ss::sstring customer_key;
    std::optional<ss::sstring> customer_key_md5;
    ss::sstring algorithm{"AES256"};

    static encryption sse_s3() { return {}; }
    static encryption sse_kms(std::optional<ss::sstring> key_id = std::nullopt);
    static encryption sse_c(
      ss::sstring customer_key,
      std::optional<ss::sstring> customer_key_md5 = std::nullopt,
      ss::sstring algorithm = "AES256");

    bool operator==(const encryption&) const = default;
    friend std::ostream& operator<<(std::ostream&, const encryption&);
};

std::ostream& operator<<(std::ostream&, encryption::kind);

/// Receives the aggregate upload fraction in [0, 1].
using progress_observer = ss::noncopyable_function<void(double)>;

struct multipart_config {
    int64_t part_size{default_part_size};
    int concurrency{default_concurrency};
    int presign_batch_size{default_presign_batch_size};
    /// Attempts per part upload, see resolve_max_attempts().
    int max_attempts{1};
    retry_policy retry{};
    /// Cancellation token; nullptr when the upload cannot be cancelled.
    ss::abort_source* as{nullptr};
    /// Upper bound of the best-effort abort call on the failure path.
    std::chrono::milliseconds abort_timeout{5000ms};
    std::optional<mpu::encryption> encryption;
    progress_observer on_progress;
};

struct multipart_result {
    ss::sstring key;
    ss::sstring upload_id;
    int total_parts{0};

    bool operator==(const multipart_result&) const = default;
    friend std::ostream& operator<<(std::ostream&, const multipart_result&);
};

} // namespace mpu

template<>
struct fmt::formatter<mpu::upload_stage> : fmt::ostream_formatter {};
template<>
struct fmt::formatter<mpu::part> : fmt::ostream_formatter {};
template<>
struct fmt::formatter<mpu::session> : fmt::ostream_formatter {};
template<>
struct fmt::formatter<mpu::presigned_part> : fmt::ostream_formatter {};
template<>
struct fmt::formatter<mpu::uploaded_part> : fmt::ostream_formatter {};
template<>
struct fmt::formatter<mpu::source_descriptor> : fmt::ostream_formatter {};
template<>
struct fmt::formatter<mpu::encryption> : fmt::ostream_formatter {};
template<>
struct fmt::formatter<mpu::multipart_result> : fmt::ostream_formatter {};
template<>
struct fmt::formatter<mpu::encryption::kind> : fmt::ostream_formatter {};
