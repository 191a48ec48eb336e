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
#include "chunk/block_writer.h"
#include "chunk/chunk_codec.h"
#include "model/fundamental.h"
#include "sink/host_runtime.h"
#include "sink/remote_store.h"
#include "utils/prefix_logger.h"

#include <seastar/core/future.hh>

#include <fmt/ostream.h>

#include <iosfwd>
#include <memory>
#include <optional>
#include <span>
#include <system_error>

namespace sink {

enum class session_state {
    recovering,
    active,
    flushing,
    closed,
};

std::ostream& operator<<(std::ostream&, session_state);

/// Archives the records of one partition.
///
/// The session owns one open chunk at a time. Records are appended to it as
/// they arrive; a flush finalizes the chunk, commits it to the remote store
/// and opens the next chunk at the offset that follows it.
///
/// If the commit fails the finalized chunk is kept. The following flush
/// commits the same files again and no records are accepted in between, so
/// the chunk boundaries never depend on whether an upload had to be retried.
///
/// Any other failure of the open chunk closes the session. Its records were
/// never committed, so the host delivers them again after the partition is
/// recovered.
class partition_session {
public:
    partition_session(
      model::partition_key key,
      chunk::writer_options opts,
      const chunk::chunk_codec& codec,
      remote_store& remote,
      host_runtime& host,
      const ss::sstring& task_name);

    partition_session(const partition_session&) = delete;
    partition_session& operator=(const partition_session&) = delete;
    partition_session(partition_session&&) = delete;
    partition_session& operator=(partition_session&&) = delete;
    ~partition_session() = default;

    /// Find the resume offset in the remote store, position the host cursor
    /// there and open the first chunk. Delivery is paused while this runs
    /// and stays paused if it fails.
    ss::future<std::error_code> recover();

    /// Encode and buffer a batch. The batch is rejected as a whole if any of
    /// its records can't be encoded.
    ss::future<std::error_code> accept_batch(std::span<const model::record>);

    /// Commit the buffered records. No-op when nothing is buffered.
    ss::future<std::error_code> flush();

    /// Delete local files; the session can't be used afterwards.
    ss::future<std::error_code> close();

    const model::partition_key& key() const { return _key; }
    session_state state() const { return _state; }
    bool has_pending_commit() const { return _sealed.has_value(); }
    /// Offset the next accepted record will get.
    model::offset next_offset() const;
    int64_t buffered_records() const;

private:
    ss::future<std::error_code> open_writer(model::offset start);
    ss::future<std::error_code> commit_sealed();
    // discard the open chunk and close the session
    ss::future<std::error_code> abandon(std::error_code);

    model::partition_key _key;
    chunk::writer_options _opts;
    const chunk::chunk_codec& _codec;
    remote_store& _remote;
    host_runtime& _host;
    prefix_logger _ctxlog;

    session_state _state{session_state::recovering};
    std::optional<chunk::codec_state> _codec_state;
    std::unique_ptr<chunk::block_writer> _writer;
    // finalized but not yet committed chunk
    std::optional<chunk::chunk_files> _sealed;
};

} // namespace sink

template<>
struct fmt::formatter<sink::session_state> : fmt::ostream_formatter {};
