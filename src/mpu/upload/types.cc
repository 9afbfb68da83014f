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

#include "upload/types.h"

#include <fmt/format.h>
#include <fmt/ostream.h>

#include <ostream>

namespace mpu {

std::ostream& operator<<(std::ostream& o, upload_stage s) {
    switch (s) {
    case upload_stage::validating:
        return o << "validating";
    case upload_stage::creating:
        return o << "creating";
    case upload_stage::splitting:
        return o << "splitting";
    case upload_stage::presigning:
        return o << "presigning";
    case upload_stage::uploading:
        return o << "uploading";
    case upload_stage::completing:
        return o << "completing";
    case upload_stage::aborting:
        return o << "aborting";
    case upload_stage::done:
        return o << "done";
    case upload_stage::failed:
        return o << "failed";
    }
    return o << "unknown";
}

std::ostream& operator<<(std::ostream& o, const part& p) {
    fmt::print(o, "{{part: {}, range: [{}, {})}}", p.part_number, p.start, p.end);
    return o;
}

std::ostream& operator<<(std::ostream& o, const session& s) {
    fmt::print(o, "{{key: {}, upload_id: {}}}", s.key, s.upload_id);
    return o;
}

std::ostream& operator<<(std::ostream& o, const presigned_part& p) {
    // Presigned URLs carry credentials in the query string.
    fmt::print(
      o,
      "{{part: {}, headers: {}}}",
      p.part_number,
      p.upload_headers.size());
    return o;
}

std::ostream& operator<<(std::ostream& o, const uploaded_part& p) {
    fmt::print(o, "{{part: {}, etag: {}}}", p.part_number, p.etag);
    return o;
}

std::ostream& operator<<(std::ostream& o, const source_descriptor& s) {
    fmt::print(
      o,
      "{{name: {}, size: {}, content_type: {}}}",
      s.name,
      s.size,
      s.content_type);
    return o;
}

std::ostream& operator<<(std::ostream& o, encryption::kind k) {
    switch (k) {
    case encryption::kind::sse_s3:
        return o << "SSE-S3";
    case encryption::kind::sse_kms:
        return o << "SSE-KMS";
    case encryption::kind::sse_c:
        return o << "SSE-C";
    }
    return o << "unknown";
}

encryption encryption::sse_kms(std::optional<ss::sstring> key_id) {
    encryption e;
    e.type = kind::sse_kms;
    e.key_id = std::move(key_id);
    return e;
}

encryption encryption::sse_c(
  ss::sstring customer_key,
  std::optional<ss::sstring> customer_key_md5,
  ss::sstring algorithm) {
    encryption e;
    e.type = kind::sse_c;
    e.customer_key = std::move(customer_key);
    e.customer_key_md5 = std::move(customer_key_md5);
    e.algorithm = std::move(algorithm);
    return e;
}

std::ostream& operator<<(std::ostream& o, const encryption& e) {
    // Key material is never printed.
    o << e.type;
    if (e.type == encryption::kind::sse_kms && e.key_id) {
        o << " key_id: " << *e.key_id;
    }
    return o;
}

std::ostream& operator<<(std::ostream& o, const multipart_result& r) {
    fmt::print(
      o,
      "{{key: {}, upload_id: {}, total_parts: {}}}",
      r.key,
      r.upload_id,
      r.total_parts);
    return o;
}

} // namespace mpu
