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
#include "upload/types.h"

#include <seastar/core/file.hh>
#include <seastar/core/future.hh>
#include <seastar/core/sstring.hh>
#include <seastar/core/temporary_buffer.hh>

#include <cstdint>
#include <memory>

namespace mpu {

/// Sliceable byte container being uploaded. Reads of disjoint ranges may
/// be issued concurrently.
class upload_source {
public:
    upload_source() = default;
    upload_source(const upload_source&) = delete;
    upload_source& operator=(const upload_source&) = delete;
    upload_source(upload_source&&) = delete;
    upload_source& operator=(upload_source&&) = delete;
    virtual ~upload_source() = default;

    virtual const ss::sstring& name() const = 0;
    virtual uint64_t size() const = 0;
    virtual const ss::sstring& content_type() const = 0;

    /// Returns exactly \p len bytes starting at \p offset.
    virtual ss::future<ss::temporary_buffer<char>>
    read(uint64_t offset, size_t len) = 0;

    virtual ss::future<> close() { return ss::make_ready_future<>(); }

    source_descriptor descriptor() const {
        return {.name = name(), .size = size(), .content_type = content_type()};
    }
};

/// Source backed by a buffer already in memory. Reads share the buffer.
class memory_source final : public upload_source {
public:
    memory_source(
      ss::sstring name,
      ss::temporary_buffer<char> data,
      ss::sstring content_type = default_content_type);

    const ss::sstring& name() const final { return _name; }
    uint64_t size() const final { return _data.size(); }
    const ss::sstring& content_type() const final { return _content_type; }

    ss::future<ss::temporary_buffer<char>>
    read(uint64_t offset, size_t len) final;

private:
    ss::sstring _name;
    ss::temporary_buffer<char> _data;
    ss::sstring _content_type;
};

/// Source backed by a file on disk. Part ranges are read on demand with
/// DMA so only the parts currently in flight are held in memory.
class file_source final : public upload_source {
public:
    static ss::future<std::unique_ptr<file_source>> open(
      ss::sstring path,
      std::optional<ss::sstring> name = std::nullopt,
      ss::sstring content_type = default_content_type);

    file_source(
      ss::file f, uint64_t size, ss::sstring name, ss::sstring content_type);

    const ss::sstring& name() const final { return _name; }
    uint64_t size() const final { return _size; }
    const ss::sstring& content_type() const final { return _content_type; }

    ss::future<ss::temporary_buffer<char>>
    read(uint64_t offset, size_t len) final;

    ss::future<> close() final;

private:
    ss::file _file;
    uint64_t _size;
    ss::sstring _name;
    ss::sstring _content_type;
};

} // namespace mpu
