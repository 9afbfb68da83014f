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

#include "json/json.h"

namespace mpu::json {

ss::sstring minify(const Value& v) {
    StringBuffer buf;
    Writer w(buf);
    v.Accept(w);
    return {buf.GetString(), buf.GetSize()};
}

bool is_valid(std::string_view text) {
    Document doc;
    doc.Parse(text.data(), text.size());
    return !doc.HasParseError();
}

} // namespace mpu::json
