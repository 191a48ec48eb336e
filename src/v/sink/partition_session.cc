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
#include "sink/partition_session.h"

#include "base/vlog.h"
#include "model/errc.h"
#include "sink/logger.h"

#include <seastar/core/coroutine.hh>

#include <ostream>

namespace sink {

std::ostream& operator<<(std::ostream& o, session_state s) {
    switch (s) {
    case session_state::recovering:
        return o << "recovering";
    case session_state::active:
        return o << "active";
    case session_state::flushing:
        return o << "flushing";
    case session_state::closed:
        return o << "closed";
    }
    return o << "unknown";
}

partition_session::partition_session(
  model::partition_key key,
  chunk::writer_options opts,
  const chunk::chunk_codec& codec,
  remote_store& remote,
  host_runtime& host,
  const ss::sstring& task_name)
  : _key(std::move(key))
  , _opts(std::move(opts))
  , _codec(codec)
  , _remote(remote)
  , _host(host)
  , _ctxlog(sink_log, fmt::format("[{}] {}", task_name, _key)) {}

model::offset partition_session::next_offset() const {
    if (!_writer) {
        return model::offset(0);
    }
    return _writer->start_offset() + model::offset(_writer->record_count());
}

int64_t partition_session::buffered_records() const {
    return _writer ? _writer->record_count() : 0;
}

ss::future<std::error_code> partition_session::recover() {
    if (_state != session_state::recovering) {
        vlog(_ctxlog.error, "Can't recover a session in state {}", _state);
        co_return model::errc::protocol_violation;
    }
    _host.pause_delivery(_key);

    auto resume = co_await _remote.resolve_resume_offset(_key);
    if (resume.has_error()) {
        if (model::is_retriable(resume.error())) {
            vlog(
              _ctxlog.warn,
              "Can't resolve resume offset, delivery stays paused: {}",
              resume.error().message());
        } else {
            vlog(
              _ctxlog.error,
              "Can't resolve resume offset: {}",
              resume.error().message());
        }
        co_return resume.error();
    }
    _host.reset_delivery_cursor(_key, resume.value());

    if (auto ec = co_await chunk::block_writer::remove_stale(
          _opts.buffer_dir, _key);
        ec) {
        co_return ec;
    }
    if (auto ec = co_await open_writer(resume.value()); ec) {
        co_return ec;
    }
    _host.resume_delivery(_key);
    _state = session_state::active;
    vlog(_ctxlog.info, "Recovered, next offset {}", resume.value());
    co_return std::error_code{};
}

ss::future<std::error_code>
partition_session::accept_batch(std::span<const model::record> batch) {
    if (_state != session_state::active) {
        vlog(_ctxlog.error, "Records delivered to a session in state {}", _state);
        co_return model::errc::protocol_violation;
    }
    if (_sealed.has_value()) {
        vlog(
          _ctxlog.warn,
          "Refusing {} records, chunk at offset {} is waiting for commit",
          batch.size(),
          _writer->start_offset());
        co_return model::errc::commit_pending;
    }
    if (batch.empty()) {
        co_return std::error_code{};
    }
    auto encoded = _codec.encode(*_codec_state, batch);
    if (encoded.has_error()) {
        co_return encoded.error();
    }
    for (auto& frame : encoded.value().frames) {
        if (auto ec = co_await _writer->append(std::move(frame), 1); ec) {
            co_return co_await abandon(ec);
        }
    }
    vlog(
      _ctxlog.trace,
      "Buffered {} records, next offset {}",
      batch.size(),
      next_offset());
    co_return std::error_code{};
}

ss::future<std::error_code> partition_session::flush() {
    if (_state != session_state::active) {
        vlog(_ctxlog.error, "Flush of a session in state {}", _state);
        co_return model::errc::protocol_violation;
    }
    if (!_sealed.has_value()) {
        if (_writer->is_empty()) {
            vlog(_ctxlog.trace, "Nothing to flush");
            co_return std::error_code{};
        }
        _state = session_state::flushing;
        auto files = co_await _writer->finalize(_codec.close(*_codec_state));
        if (files.has_error()) {
            co_return co_await abandon(files.error());
        }
        _sealed = files.value();
    }
    _state = session_state::flushing;
    co_return co_await commit_sealed();
}

ss::future<std::error_code> partition_session::commit_sealed() {
    auto start = _writer->start_offset();
    auto next = co_await _remote.commit(*_sealed, _key, start);
    if (next.has_error()) {
        if (!model::is_retriable(next.error())) {
            co_return co_await abandon(next.error());
        }
        _state = session_state::active;
        vlog(
          _ctxlog.warn,
          "Commit of chunk at offset {} failed, it will be retried on the "
          "next flush: {}",
          start,
          next.error().message());
        co_return next.error();
    }

    if (auto ec = co_await _writer->discard(); ec) {
        // the chunk is committed, leftovers are removed on next recovery
        vlog(
          _ctxlog.warn,
          "Committed chunk {} wasn't removed: {}",
          _sealed->data_path.native(),
          ec.message());
    }
    _sealed.reset();
    _writer.reset();
    _codec_state.reset();

    if (auto ec = co_await open_writer(next.value()); ec) {
        // without a writer the session can't accept records anymore
        _state = session_state::closed;
        co_return ec;
    }
    _state = session_state::active;
    vlog(_ctxlog.debug, "Committed offsets [{}, {})", start, next.value());
    co_return std::error_code{};
}

ss::future<std::error_code> partition_session::close() {
    if (_state == session_state::closed) {
        vlog(_ctxlog.error, "Session is already closed");
        co_return model::errc::protocol_violation;
    }
    _state = session_state::closed;
    std::error_code ec;
    if (_writer) {
        ec = co_await _writer->discard();
        _writer.reset();
    }
    _sealed.reset();
    _codec_state.reset();
    vlog(_ctxlog.info, "Closed");
    co_return ec;
}

ss::future<std::error_code> partition_session::abandon(std::error_code ec) {
    vlog(
      _ctxlog.error,
      "Closing session, chunk at offset {} is lost: {}",
      _writer->start_offset(),
      ec.message());
    _state = session_state::closed;
    if (auto discard_ec = co_await _writer->discard(); discard_ec) {
        // leftovers are removed on next recovery
        vlog(
          _ctxlog.warn,
          "Local files of the abandoned chunk weren't removed: {}",
          discard_ec.message());
    }
    _writer.reset();
    _sealed.reset();
    _codec_state.reset();
    co_return ec;
}

ss::future<std::error_code> partition_session::open_writer(model::offset start) {
    auto state = _codec.open(_key, start);
    auto w = co_await chunk::block_writer::open(
      _opts, _key, start, state.header.share());
    if (w.has_error()) {
        co_return w.error();
    }
    _writer = std::move(w.value());
    _codec_state = std::move(state);
    co_return std::error_code{};
}

} // namespace sink
