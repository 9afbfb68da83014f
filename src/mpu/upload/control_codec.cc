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

#include "upload/control_codec.h"

#include "http/url.h"
#include "json/json.h"

#include <seastar/core/print.hh>

#include <stdexcept>

namespace mpu::codec {

namespace {

using json::write_member;

void write_encryption(json::Writer& w, const encryption& e) {
    w.StartObject();
    write_member(w, "type", ss::format("{}", e.type));
    switch (e.type) {
    case encryption::kind::sse_s3:
        break;
    case encryption::kind::sse_kms:
        if (e.key_id) {
            write_member(w, "keyId", *e.key_id);
        }
        break;
    case encryption::kind::sse_c:
        write_member(w, "customerKey", e.customer_key);
        if (e.customer_key_md5) {
            write_member(w, "customerKeyMd5", *e.customer_key_md5);
        }
        write_member(w, "algorithm", e.algorithm);
        break;
    }
    w.EndObject();
}

void write_optional_encryption(
  json::Writer& w, const std::optional<encryption>& enc) {
    if (enc) {
        w.Key("encryption");
        write_encryption(w, *enc);
    }
}

void write_session(json::Writer& w, const session& s) {
    write_member(w, "key", s.key);
    write_member(w, "uploadId", s.upload_id);
}

ss::sstring to_sstring(const json::StringBuffer& buf) {
    return {buf.GetString(), buf.GetSize()};
}

/// Parses \p body, reporting failures with \p code.
json::Document parse(std::string_view body, errc code, upload_stage stage) {
    json::Document doc;
    doc.Parse(body.data(), body.size());
    if (doc.HasParseError()) {
        throw upload_error(
          code,
          ss::format(
            "response is not valid JSON (error {} at offset {})",
            static_cast<int>(doc.GetParseError()),
            doc.GetErrorOffset()),
          stage);
    }
    if (!doc.IsObject()) {
        throw upload_error(code, "response is not a JSON object", stage);
    }
    return doc;
}

std::optional<ss::sstring>
non_empty_string(const json::Value& obj, std::string_view key) {
    const auto* v = json::find_member(obj, key);
    if (v == nullptr || !v->IsString() || v->GetStringLength() == 0) {
        return std::nullopt;
    }
    return ss::sstring(v->GetString(), v->GetStringLength());
}

} // namespace

ss::sstring encode_create_request(
  const source_descriptor& source,
  std::string_view metadata,
  const std::optional<encryption>& enc) {
    json::StringBuffer buf;
    json::Writer w(buf);
    w.StartObject();
    w.Key("sourceDescriptor");
    w.StartObject();
    write_member(w, "name", source.name);
    write_member(w, "size", source.size);
    write_member(w, "contentType", source.content_type);
    w.EndObject();
    if (!metadata.empty()) {
        w.Key("metadata");
        w.RawValue(metadata.data(), metadata.size(), rapidjson::kObjectType);
    }
    write_optional_encryption(w, enc);
    w.EndObject();
    return to_sstring(buf);
}

session decode_create_response(std::string_view body) {
    auto doc = parse(body, errc::invalid_create_response, upload_stage::creating);
    auto upload_id = non_empty_string(doc, "uploadId");
    auto key = non_empty_string(doc, "key");
    if (!upload_id || !key) {
        throw upload_error(
          errc::invalid_create_response,
          ss::format(
            "create response lacks a non-empty {}",
            upload_id ? "key" : "uploadId"),
          upload_stage::creating);
    }
    return session{.key = std::move(*key), .upload_id = std::move(*upload_id)};
}

ss::sstring encode_presign_request(
  const session& s,
  const std::vector<int>& part_numbers,
  const std::optional<encryption>& enc) {
    json::StringBuffer buf;
    json::Writer w(buf);
    w.StartObject();
    write_session(w, s);
    write_member(w, "partNumbers", part_numbers);
    write_optional_encryption(w, enc);
    w.EndObject();
    return to_sstring(buf);
}

std::vector<presigned_part> decode_presign_response(std::string_view body) {
    constexpr auto code = errc::invalid_presign_response;
    constexpr auto stage = upload_stage::presigning;
    auto doc = parse(body, code, stage);
    const auto* parts = json::find_member(doc, "parts");
    if (parts == nullptr || !parts->IsArray()) {
        throw upload_error(code, "presign response lacks a parts array", stage);
    }
    std::vector<presigned_part> out;
    out.reserve(parts->Size());
    for (const auto& entry : parts->GetArray()) {
        const auto* number = json::find_member(entry, "partNumber");
        if (number == nullptr || !number->IsInt() || number->GetInt() < 1) {
            throw upload_error(
              code, "presigned part without a valid partNumber", stage);
        }
        presigned_part p{.part_number = number->GetInt()};
        auto url = non_empty_string(entry, "presignedUrl");
        if (!url) {
            throw upload_error(
              code,
              ss::format("presigned part {} has no URL", p.part_number),
              stage,
              p.part_number);
        }
        try {
            http::parse_url(*url);
        } catch (const std::invalid_argument& e) {
            throw upload_error(
              code,
              ss::format(
                "presigned part {} has an unusable URL: {}",
                p.part_number,
                e.what()),
              stage,
              p.part_number);
        }
        p.url = std::move(*url);
        if (const auto* headers = json::find_member(entry, "uploadHeaders");
            headers != nullptr && !headers->IsNull()) {
            if (!headers->IsObject()) {
                throw upload_error(
                  code,
                  ss::format(
                    "uploadHeaders of part {} is not an object", p.part_number),
                  stage,
                  p.part_number);
            }
            for (const auto& h : headers->GetObject()) {
                if (!h.value.IsString()) {
                    throw upload_error(
                      code,
                      ss::format(
                        "upload header {} of part {} is not a string",
                        json::as_string_view(h.name),
                        p.part_number),
                      stage,
                      p.part_number);
                }
                p.upload_headers.emplace(
                  ss::sstring(h.name.GetString(), h.name.GetStringLength()),
                  ss::sstring(h.value.GetString(), h.value.GetStringLength()));
            }
        }
        out.push_back(std::move(p));
    }
    return out;
}

ss::sstring encode_complete_request(
  const session& s, const std::vector<uploaded_part>& parts) {
    json::StringBuffer buf;
    json::Writer w(buf);
    w.StartObject();
    write_session(w, s);
    w.Key("parts");
    w.StartArray();
    for (const auto& p : parts) {
        w.StartObject();
        write_member(w, "partNumber", p.part_number);
        write_member(w, "eTag", p.etag);
        w.EndObject();
    }
    w.EndArray();
    w.EndObject();
    return to_sstring(buf);
}

std::optional<ss::sstring> decode_complete_response(std::string_view body) {
    json::Document doc;
    doc.Parse(body.data(), body.size());
    if (doc.HasParseError() || !doc.IsObject()) {
        return std::nullopt;
    }
    return non_empty_string(doc, "key");
}

ss::sstring encode_abort_request(const session& s) {
    json::StringBuffer buf;
    json::Writer w(buf);
    w.StartObject();
    write_session(w, s);
    w.EndObject();
    return to_sstring(buf);
}

std::optional<server_error::payload>
decode_error_payload(std::string_view body) {
    json::Document doc;
    doc.Parse(body.data(), body.size());
    if (doc.HasParseError() || !doc.IsObject()) {
        return std::nullopt;
    }
    auto message = non_empty_string(doc, "message");
    auto code = non_empty_string(doc, "code");
    if (!message || !code) {
        return std::nullopt;
    }
    server_error::payload p{
      .origin = non_empty_string(doc, "origin").value_or("server"),
      .code = std::move(*code),
      .message = std::move(*message),
      .recovery_suggestion = non_empty_string(doc, "recoverySuggestion")};
    if (const auto* details = json::find_member(doc, "details");
        details != nullptr && !details->IsNull()) {
        p.details = json::minify(*details);
    }
    if (const auto* status = json::find_member(doc, "httpStatus");
        status != nullptr && status->IsInt()) {
        p.http_status = status->GetInt();
    }
    return p;
}

} // namespace mpu::codec
