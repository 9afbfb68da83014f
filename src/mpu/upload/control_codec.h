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
#include "upload/errors.h"
#include "upload/types.h"

#include <seastar/core/sstring.hh>

#include <optional>
#include <string_view>
#include <vector>

/// JSON bodies exchanged with the control endpoints.
namespace mpu::codec {

ss::sstring encode_create_request(
  const source_descriptor& source,
  std::string_view metadata,
  const std::optional<encryption>& enc);

/// Throws upload_error(errc::invalid_create_response) unless the body holds
/// non-empty uploadId and key strings.
session decode_create_response(std::string_view body);

ss::sstring encode_presign_request(
  const session& s,
  const std::vector<int>& part_numbers,
  const std::optional<encryption>& enc);

/// Throws upload_error(errc::invalid_presign_response) on a malformed body or
/// part entry, including a URL that is not absolute http(s).
std::vector<presigned_part> decode_presign_response(std::string_view body);

ss::sstring encode_complete_request(
  const session& s, const std::vector<uploaded_part>& parts);

/// Key of the completed object, if the body names one.
std::optional<ss::sstring> decode_complete_response(std::string_view body);

ss::sstring encode_abort_request(const session& s);

/// Parses {origin, code, message, details, httpStatus, recoverySuggestion}.
/// Returns nullopt when the body is not such a payload.
std::optional<server_error::payload>
decode_error_payload(std::string_view body);

} // namespace mpu::codec
