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
#include "sink/task_coordinator.h"

#include "base/vlog.h"
#include "model/errc.h"
#include "sink/logger.h"

#include <seastar/core/coroutine.hh>
#include <seastar/core/seastar.hh>

#include <exception>

namespace sink {

task_coordinator::task_coordinator(
  configuration cfg, object_store::client& client, host_runtime& host)
  : _cfg(std::move(cfg))
  , _format(chunk::make_record_format(_cfg.format))
  , _codec(*_format)
  , _remote(
      client,
      _cfg.bucket,
      _cfg.prefix,
      std::chrono::duration_cast<ss::lowres_clock::duration>(
        _cfg.remote_timeout))
  , _host(host)
  , _ctxlog(sink_log, fmt::format("[{}]", _cfg.name)) {}

const partition_session*
task_coordinator::session(const model::partition_key& key) const {
    auto it = _sessions.find(key);
    return it == _sessions.end() ? nullptr : it->second.get();
}

bool task_coordinator::check_running(std::string_view operation) const {
    if (_state == state::running) {
        return true;
    }
    vlog(
      _ctxlog.error,
      "{} called while the task is {}",
      operation,
      _state == state::created ? "not started" : "stopped");
    return false;
}

ss::future<std::error_code> task_coordinator::start(
  std::vector<model::partition_key> initial_assignment) {
    if (_state != state::created) {
        vlog(_ctxlog.error, "Task is already started");
        co_return model::errc::protocol_violation;
    }
    try {
        co_await ss::recursive_touch_directory(_cfg.buffer_dir.native());
    } catch (...) {
        vlog(
          _ctxlog.error,
          "Can't create buffer directory {}: {}",
          _cfg.buffer_dir.native(),
          std::current_exception());
        co_return model::errc::local_io_error;
    }
    _state = state::running;
    vlog(
      _ctxlog.info,
      "Started, writing {} chunks to bucket {} under '{}'",
      _format->name(),
      _cfg.bucket,
      _cfg.prefix);
    co_return co_await on_assigned(std::move(initial_assignment));
}

ss::future<> task_coordinator::stop() {
    if (_state == state::stopped) {
        co_return;
    }
    _state = state::stopped;
    for (auto& [key, session] : _sessions) {
        if (session->state() == session_state::closed) {
            continue;
        }
        if (auto ec = co_await session->close(); ec) {
            vlog(
              _ctxlog.warn,
              "Failed to discard local files of {}: {}",
              key,
              ec.message());
        }
    }
    _sessions.clear();
    vlog(_ctxlog.info, "Stopped");
}

ss::future<std::error_code>
task_coordinator::on_assigned(std::vector<model::partition_key> partitions) {
    if (!check_running("on_assigned")) {
        co_return model::errc::protocol_violation;
    }
    std::error_code first_retriable;
    for (auto& key : partitions) {
        if (_sessions.contains(key)) {
            vlog(_ctxlog.debug, "{} is already assigned", key);
            continue;
        }
        auto session = std::make_unique<partition_session>(
          key, _cfg.writer_options(), _codec, _remote, _host, _cfg.name);
        auto ec = co_await session->recover();
        if (!ec) {
            _sessions.emplace(key, std::move(session));
            continue;
        }
        if (!model::is_retriable(ec)) {
            co_return ec;
        }
        if (!first_retriable) {
            first_retriable = ec;
        }
    }
    co_return first_retriable;
}

ss::future<std::error_code>
task_coordinator::on_revoked(std::vector<model::partition_key> partitions) {
    if (!check_running("on_revoked")) {
        co_return model::errc::protocol_violation;
    }
    for (const auto& key : partitions) {
        auto it = _sessions.find(key);
        if (it == _sessions.end()) {
            vlog(_ctxlog.debug, "{} isn't assigned, nothing to revoke", key);
            continue;
        }
        auto session = std::move(it->second);
        _sessions.erase(it);
        if (session->state() == session_state::closed) {
            continue;
        }
        if (auto ec = co_await session->close(); ec) {
            vlog(
              _ctxlog.warn,
              "Failed to discard local files of {}: {}",
              key,
              ec.message());
        }
    }
    co_return std::error_code{};
}

ss::future<std::error_code>
task_coordinator::on_records_delivered(records_by_partition records) {
    if (!check_running("on_records_delivered")) {
        co_return model::errc::protocol_violation;
    }
    // Nothing is buffered unless every partition can take its records, so
    // a rejected delivery can be repeated as a whole.
    std::error_code refused;
    for (const auto& [key, batch] : records) {
        auto it = _sessions.find(key);
        if (it == _sessions.end()) {
            vlog(
              _ctxlog.error,
              "{} records delivered for unassigned partition {}",
              batch.size(),
              key);
            co_return model::errc::protocol_violation;
        }
        const auto& session = *it->second;
        if (session.state() != session_state::active) {
            vlog(
              _ctxlog.error,
              "{} records delivered for {} in state {}",
              batch.size(),
              key,
              session.state());
            co_return model::errc::protocol_violation;
        }
        if (session.has_pending_commit() && !refused) {
            vlog(
              _ctxlog.warn,
              "Refusing delivery, {} is waiting for a commit",
              key);
            refused = model::errc::commit_pending;
        }
    }
    if (refused) {
        co_return refused;
    }
    for (const auto& [key, batch] : records) {
        if (auto ec = co_await _sessions.at(key)->accept_batch(batch); ec) {
            co_return ec;
        }
    }
    co_return std::error_code{};
}

ss::future<std::error_code> task_coordinator::on_commit_requested() {
    if (!check_running("on_commit_requested")) {
        co_return model::errc::protocol_violation;
    }
    std::error_code first_retriable;
    for (auto& [key, session] : _sessions) {
        auto ec = co_await session->flush();
        if (!ec) {
            continue;
        }
        if (!model::is_retriable(ec)) {
            vlog(
              _ctxlog.error,
              "Flush of {} failed, aborting commit: {}",
              key,
              ec.message());
            co_return ec;
        }
        if (!first_retriable) {
            first_retriable = ec;
        }
    }
    co_return first_retriable;
}

} // namespace sink
