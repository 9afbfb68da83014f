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

#include "upload/orchestrator.h"

#include "base/vassert.h"
#include "base/vlog.h"
#include "json/json.h"
#include "upload/errors.h"
#include "upload/logger.h"
#include "upload/part_transport.h"

#include <seastar/core/coroutine.hh>
#include <seastar/core/loop.hh>
#include <seastar/core/print.hh>
#include <seastar/core/timer.hh>

#include <boost/range/irange.hpp>

#include <algorithm>
#include <limits>

namespace mpu {

multipart_upload::multipart_upload(
  control_channel& control,
  http::abstract_client& transport,
  upload_source& source,
  ss::sstring metadata,
  multipart_config cfg)
  : _control(control)
  , _transport(transport)
  , _source(source)
  , _metadata(std::move(metadata))
  , _cfg(std::move(cfg))
  , _log(mpu_log, ss::format("{}", _source.name())) {}

void multipart_upload::set_stage(upload_stage s) {
    mlog(_log.debug, "{} -> {}", _stage, s);
    _stage = s;
}

void multipart_upload::validate() const {
    constexpr auto stage = upload_stage::validating;
    if (_cfg.part_size <= 0) {
        throw upload_error(
          errc::invalid_part_size,
          ss::format("part size must be positive, got {}", _cfg.part_size),
          stage);
    }
    if (_cfg.concurrency <= 0) {
        throw upload_error(
          errc::invalid_concurrency,
          ss::format("concurrency must be positive, got {}", _cfg.concurrency),
          stage);
    }
    if (_cfg.presign_batch_size <= 0) {
        throw upload_error(
          errc::invalid_batch_size,
          ss::format(
            "presign batch size must be positive, got {}",
            _cfg.presign_batch_size),
          stage);
    }
    if (_source.size() == 0) {
        throw upload_error(
          errc::empty_source,
          ss::format("{} has no bytes to upload", _source.name()),
          stage);
    }
    auto part_count = (_source.size() + static_cast<uint64_t>(_cfg.part_size)
                       - 1)
                      / static_cast<uint64_t>(_cfg.part_size);
    if (part_count > static_cast<uint64_t>(std::numeric_limits<int>::max())) {
        throw upload_error(
          errc::invalid_part_size,
          ss::format(
            "part size {} splits {} bytes into {} parts, more than can be "
            "numbered",
            _cfg.part_size,
            _source.size(),
            part_count),
          stage);
    }
    if (!_metadata.empty() && !json::is_valid(_metadata)) {
        throw upload_error(
          errc::invalid_metadata, "metadata must be a JSON value", stage);
    }
}

void multipart_upload::check_cancelled() const {
    if (_cfg.as != nullptr) {
        _cfg.as->check();
    }
}

ss::future<multipart_result> multipart_upload::run() {
    massert(
      _stage == upload_stage::validating, "upload already ran: {}", _stage);
    try {
        validate();
    } catch (const upload_error& e) {
        mlog(_log.warn, "Rejected upload: {}", e.what());
        _stage = upload_stage::failed;
        throw;
    }

    set_stage(upload_stage::creating);
    std::exception_ptr failure;
    try {
        check_cancelled();
        _session = co_await _control.create(
          _source.descriptor(), _metadata, _cfg.encryption, _cfg.as);
    } catch (...) {
        failure = to_upload_error(
          std::current_exception(), upload_stage::creating);
    }
    if (failure) {
        // No session exists, nothing to abort.
        mlog(_log.warn, "Failed to create upload: {}", failure);
        _stage = upload_stage::failed;
        std::rethrow_exception(failure);
    }
    _log.set_prefix(ss::format("{}/{}", _session.key, _session.upload_id));
    mlog(
      _log.info,
      "Created upload of {} bytes, part size {}",
      _source.size(),
      _cfg.part_size);

    try {
        set_stage(upload_stage::splitting);
        _parts = split_into_parts(
          _source.size(), static_cast<uint64_t>(_cfg.part_size));
        _progress.emplace(_source.size(), _parts.size());

        set_stage(upload_stage::presigning);
        co_await presign_all();

        set_stage(upload_stage::uploading);
        co_await upload_all();

        set_stage(upload_stage::completing);
        auto key = co_await complete();

        set_stage(upload_stage::done);
        multipart_result result{
          .key = std::move(key),
          .upload_id = _session.upload_id,
          .total_parts = static_cast<int>(_parts.size())};
        mlog(_log.info, "Completed upload: {}", result);
        co_return result;
    } catch (...) {
        failure = to_upload_error(std::current_exception(), _stage);
    }

    mlog(_log.error, "Upload failed: {}", failure);
    co_await abort_session();
    _stage = upload_stage::failed;
    std::rethrow_exception(failure);
}

ss::future<> multipart_upload::presign_all() {
    const auto batch = static_cast<size_t>(_cfg.presign_batch_size);
    _presigned.resize(_parts.size());
    for (size_t first = 0; first < _parts.size(); first += batch) {
        check_cancelled();
        auto last = std::min(first + batch, _parts.size());
        std::vector<int> numbers;
        numbers.reserve(last - first);
        for (auto i = first; i < last; ++i) {
            numbers.push_back(_parts[i].part_number);
        }
        auto answer = co_await _control.presign_parts(
          _session, numbers, _cfg.encryption, _cfg.as);
        validate_presigned_batch(numbers, answer, _parts.size());
        for (auto& p : answer) {
            auto idx = static_cast<size_t>(p.part_number - 1);
            _presigned[idx] = std::move(p);
        }
        mlog(
          _log.debug,
          "Presigned parts {}-{} of {}",
          numbers.front(),
          numbers.back(),
          _parts.size());
    }
}

ss::future<> multipart_upload::upload_all() {
    auto workers = std::min(
      static_cast<size_t>(_cfg.concurrency), _parts.size());
    _uploaded.reserve(_parts.size());
    mlog(
      _log.debug, "Uploading {} parts with {} workers", _parts.size(), workers);
    co_await ss::parallel_for_each(
      boost::irange<size_t>(0, workers),
      [this](size_t id) { return worker(id); });
    if (_first_failure) {
        // The token may have fired while claims were draining after an
        // earlier failure; cancellation is what the caller asked for.
        check_cancelled();
        std::rethrow_exception(_first_failure);
    }
}

ss::future<> multipart_upload::worker(size_t id) {
    while (!_first_failure && _next_part < _parts.size()) {
        const auto& p = _parts[_next_part++];
        const auto& target = _presigned[p.part_number - 1];
        try {
            check_cancelled();
            auto bytes = co_await _source.read(p.start, p.size());
            auto uploaded = co_await upload_part(
              _transport,
              part_upload_request{
                .url = target.url,
                .part_number = p.part_number,
                .bytes = std::move(bytes),
                .headers = target.upload_headers,
                .as = _cfg.as,
                .on_progress =
                  [this, n = p.part_number](size_t sent) {
                      report_progress(n, sent);
                  }},
              retry_options{
                .max_attempts = std::max(1, _cfg.max_attempts),
                .policy = _cfg.retry});
            report_progress(p.part_number, p.size());
            mlog(_log.debug, "Worker {} uploaded {}", id, uploaded);
            _uploaded.push_back(std::move(uploaded));
        } catch (...) {
            auto err = to_upload_error(
              std::current_exception(), upload_stage::uploading, p.part_number);
            if (!_first_failure) {
                mlog(
                  _log.warn,
                  "Worker {} failed on part {}, stopping further claims: {}",
                  id,
                  p.part_number,
                  err);
                _first_failure = err;
            } else {
                mlog(
                  _log.debug,
                  "Worker {} failed on part {} after an earlier failure: {}",
                  id,
                  p.part_number,
                  err);
            }
        }
    }
}

ss::future<ss::sstring> multipart_upload::complete() {
    massert(
      _uploaded.size() == _parts.size(),
      "{} of {} parts uploaded before completion",
      _uploaded.size(),
      _parts.size());
    // Workers finish out of order, the manifest must be ascending.
    std::sort(
      _uploaded.begin(), _uploaded.end(), [](const auto& a, const auto& b) {
          return a.part_number < b.part_number;
      });
    check_cancelled();
    return _control.complete(_session, _uploaded, _cfg.as);
}

ss::future<> multipart_upload::abort_session() {
    set_stage(upload_stage::aborting);
    // The caller's token may already have fired, abort runs on its own.
    ss::abort_source as;
    ss::timer<> deadline([&as] { as.request_abort(); });
    deadline.arm(_cfg.abort_timeout);
    try {
        co_await _control.abort(_session, &as);
        mlog(_log.info, "Aborted upload");
    } catch (...) {
        mlog(
          _log.warn,
          "Ignoring failure to abort upload: {}",
          std::current_exception());
    }
    deadline.cancel();
}

void multipart_upload::report_progress(int part_number, uint64_t loaded) {
    _progress->update(part_number, loaded);
    auto fraction = _progress->fraction();
    mlog(
      _log.trace,
      "Part {} at {} bytes, total {:.3f}",
      part_number,
      loaded,
      fraction);
    if (_cfg.on_progress) {
        _cfg.on_progress(fraction);
    }
}

ss::future<multipart_result> execute_multipart_upload(
  control_channel& control,
  http::abstract_client& transport,
  upload_source& source,
  ss::sstring metadata,
  multipart_config cfg) {
    multipart_upload upload(
      control, transport, source, std::move(metadata), std::move(cfg));
    co_return co_await upload.run();
}

} // namespace mpu
