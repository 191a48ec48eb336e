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
#include "chunk/chunk_codec.h"
#include "chunk/record_format.h"
#include "model/fundamental.h"
#include "object_store/client.h"
#include "sink/configuration.h"
#include "sink/host_runtime.h"
#include "sink/partition_session.h"
#include "sink/remote_store.h"
#include "utils/prefix_logger.h"

#include <seastar/core/future.hh>

#include <absl/container/btree_map.h>

#include <memory>
#include <system_error>
#include <vector>

namespace sink {

/// Entry point of the sink. Translates the host lifecycle calls into
/// operations on per-partition sessions.
///
/// All calls must be made sequentially from the shard that created the
/// coordinator. Every call returns an error code; model::is_retriable()
/// tells whether the host may repeat it.
class task_coordinator {
public:
    using records_by_partition
      = absl::btree_map<model::partition_key, model::record_batch>;

    task_coordinator(
      configuration cfg, object_store::client& client, host_runtime& host);

    task_coordinator(const task_coordinator&) = delete;
    task_coordinator& operator=(const task_coordinator&) = delete;
    task_coordinator(task_coordinator&&) = delete;
    task_coordinator& operator=(task_coordinator&&) = delete;
    ~task_coordinator() = default;

    /// Create the buffer directory and recover the initial assignment.
    ss::future<std::error_code>
    start(std::vector<model::partition_key> initial_assignment);

    /// Discard every session. Buffered records that weren't committed are
    /// dropped; they are delivered again after the next assignment.
    ss::future<> stop();

    ss::future<std::error_code>
    on_assigned(std::vector<model::partition_key> partitions);

    ss::future<std::error_code>
    on_revoked(std::vector<model::partition_key> partitions);

    ss::future<std::error_code> on_records_delivered(records_by_partition);

    /// Commit the buffered records of every partition. Offsets the host may
    /// have tracked are irrelevant, committed state is derived from the
    /// object store.
    ss::future<std::error_code> on_commit_requested();

    bool has_session(const model::partition_key& key) const {
        return _sessions.contains(key);
    }
    const partition_session* session(const model::partition_key& key) const;
    size_t session_count() const { return _sessions.size(); }

    const configuration& config() const { return _cfg; }

private:
    enum class state { created, running, stopped };

    bool check_running(std::string_view operation) const;

    configuration _cfg;
    std::unique_ptr<chunk::record_format> _format;
    chunk::chunk_codec _codec;
    remote_store _remote;
    host_runtime& _host;
    prefix_logger _ctxlog;
    state _state{state::created};
    absl::btree_map<model::partition_key, std::unique_ptr<partition_session>>
      _sessions;
};

} // namespace sink
