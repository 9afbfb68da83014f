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
#include "base/vlog.h"
#include "json/logger.h"

#include <seastar/core/sstring.hh>

#include <rapidjson/allocators.h>
#include <rapidjson/document.h>
#include <rapidjson/encodings.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <cstdint>
#include <new>
#include <optional>
#include <string_view>
#include <vector>

namespace mpu::json {

/// rapidjson allocator that reports exhaustion with std::bad_alloc instead
/// of returning nullptr into rapidjson internals.
class throwing_allocator {
public:
    static const bool kNeedFree = rapidjson::CrtAllocator::kNeedFree;

    void* Malloc(size_t size) {
        void* res = _alloc.Malloc(size);
        if (!res && size != 0) {
            mlog(json_log.error, "Could not allocate {} bytes", size);
            throw std::bad_alloc{};
        }
        return res;
    }

    void* Realloc(void* original, size_t original_size, size_t new_size) {
        void* res = _alloc.Realloc(original, original_size, new_size);
        if (!res && new_size != 0) {
            mlog(
              json_log.error,
              "Could not reallocate {} bytes to {} bytes",
              original_size,
              new_size);
            throw std::bad_alloc{};
        }
        return res;
    }

    static void Free(void* ptr) { rapidjson::CrtAllocator::Free(ptr); }

private:
    [[no_unique_address]] rapidjson::CrtAllocator _alloc;
};

using MemoryPoolAllocator = rapidjson::MemoryPoolAllocator<throwing_allocator>;

using StringBuffer
  = rapidjson::GenericStringBuffer<rapidjson::UTF8<>, throwing_allocator>;

using Writer = rapidjson::
  Writer<StringBuffer, rapidjson::UTF8<>, rapidjson::UTF8<>, throwing_allocator>;

using Document = rapidjson::
  GenericDocument<rapidjson::UTF8<>, MemoryPoolAllocator, throwing_allocator>;

using Value = Document::ValueType;

inline void rjson_serialize(Writer& w, bool v) { w.Bool(v); }
inline void rjson_serialize(Writer& w, int v) { w.Int(v); }
inline void rjson_serialize(Writer& w, int64_t v) { w.Int64(v); }
inline void rjson_serialize(Writer& w, uint64_t v) { w.Uint64(v); }
inline void rjson_serialize(Writer& w, std::string_view v) {
    w.String(v.data(), v.size());
}
inline void rjson_serialize(Writer& w, const char* v) {
    rjson_serialize(w, std::string_view(v));
}
inline void rjson_serialize(Writer& w, const ss::sstring& v) {
    w.String(v.data(), v.size());
}

template<typename T>
void rjson_serialize(Writer& w, const std::optional<T>& v) {
    if (v) {
        rjson_serialize(w, *v);
    } else {
        w.Null();
    }
}

template<typename T>
void rjson_serialize(Writer& w, const std::vector<T>& v) {
    w.StartArray();
    for (const auto& e : v) {
        rjson_serialize(w, e);
    }
    w.EndArray();
}

/// Writes a key followed by its serialized value.
template<typename T>
void write_member(Writer& w, std::string_view key, const T& v) {
    w.Key(key.data(), key.size());
    rjson_serialize(w, v);
}

/// Views a rapidjson string value without copying.
inline std::string_view as_string_view(const Value& v) {
    return {v.GetString(), v.GetStringLength()};
}

/// Member lookup that tolerates non-object values and absent keys.
inline const Value* find_member(const Value& obj, std::string_view key) {
    if (!obj.IsObject()) {
        return nullptr;
    }
    auto it = obj.FindMember(
      Value(key.data(), static_cast<rapidjson::SizeType>(key.size())));
    return it == obj.MemberEnd() ? nullptr : &it->value;
}

/// Re-serializes a parsed value into compact JSON text.
ss::sstring minify(const Value& v);

/// True when \p text parses as a complete JSON value.
bool is_valid(std::string_view text);

} // namespace mpu::json
