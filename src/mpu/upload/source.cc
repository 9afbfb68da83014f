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

#include "upload/source.h"

#include "base/vlog.h"
#include "upload/logger.h"

#include <seastar/core/coroutine.hh>
#include <seastar/core/print.hh>
#include <seastar/core/seastar.hh>

#include <filesystem>
#include <stdexcept>

namespace mpu {

namespace {

void check_range(
  const ss::sstring& name, uint64_t size, uint64_t offset, size_t len) {
    if (offset > size || len > size - offset) {
        throw std::out_of_range(ss::format(
          "read of [{}, {}) is outside of {} ({} bytes)",
          offset,
          offset + len,
          name,
          size));
    }
}

} // namespace

memory_source::memory_source(
  ss::sstring name, ss::temporary_buffer<char> data, ss::sstring content_type)
  : _name(std::move(name))
  , _data(std::move(data))
  , _content_type(std::move(content_type)) {}

ss::future<ss::temporary_buffer<char>>
memory_source::read(uint64_t offset, size_t len) {
    check_range(_name, _data.size(), offset, len);
    return ss::make_ready_future<ss::temporary_buffer<char>>(
      _data.share(offset, len));
}

ss::future<std::unique_ptr<file_source>> file_source::open(
  ss::sstring path,
  std::optional<ss::sstring> name,
  ss::sstring content_type) {
    auto f = co_await ss::open_file_dma(path, ss::open_flags::ro);
    auto size = co_await f.size();
    if (!name) {
        name = ss::sstring(std::filesystem::path(path).filename().string());
    }
    mlog(mpu_log.debug, "Opened {} as {} ({} bytes)", path, *name, size);
    co_return std::make_unique<file_source>(
      std::move(f), size, std::move(*name), std::move(content_type));
}

file_source::file_source(
  ss::file f, uint64_t size, ss::sstring name, ss::sstring content_type)
  : _file(std::move(f))
  , _size(size)
  , _name(std::move(name))
  , _content_type(std::move(content_type)) {}

ss::future<ss::temporary_buffer<char>>
file_source::read(uint64_t offset, size_t len) {
    check_range(_name, _size, offset, len);
    return _file.dma_read_exactly<char>(offset, len);
}

ss::future<> file_source::close() { return _file.close(); }

} // namespace mpu
