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

#include "base/outcome.h"
#include "base/seastarx.h"
#include "chunk/chunk_codec.h"
#include "chunk/chunk_index.h"
#include "model/fundamental.h"
#include "object_store/client.h"

#include <seastar/core/future.hh>
#include <seastar/core/lowres_clock.hh>

#include <vector>

namespace chunk {

struct reader_config {
    object_store::bucket_name bucket;
    // normalized, see normalize_prefix()
    ss::sstring prefix;
    ss::lowres_clock::duration timeout;
};

/// Random access to committed remote chunks.
///
/// A read downloads the chunk index, checks that the data object has the size
/// the index describes, picks the segment holding the requested offset and
/// fetches only that byte range of the data object. Following
/// segments are fetched one by one until enough records were decoded.
class chunk_reader {
public:
    chunk_reader(
      object_store::client& client, reader_config cfg, const chunk_codec& codec)
      : _client(client)
      , _cfg(std::move(cfg))
      , _codec(codec) {}

    ss::future<result<chunk_index>>
    fetch_index(const model::partition_key& key, model::offset chunk_start);

    /// Read at most 'max_records' records starting at offset 'from' of the
    /// chunk that starts at 'chunk_start'. An offset outside of the chunk
    /// yields an empty result.
    ss::future<result<std::vector<model::record>>> read(
      const model::partition_key& key,
      model::offset chunk_start,
      model::offset from,
      size_t max_records);

private:
    ss::future<result<std::vector<model::record>>> read_segment(
      const object_store::object_key& data_key,
      const segment_entry& entry,
      uint64_t file_pos);

    object_store::client& _client;
    reader_config _cfg;
    const chunk_codec& _codec;
};

} // namespace chunk
