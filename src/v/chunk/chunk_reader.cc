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
#include "chunk/chunk_reader.h"

#include "base/vlog.h"
#include "chunk/logger.h"
#include "chunk/path_utils.h"
#include "chunk/remote_io.h"
#include "compression/gzip_segment_compressor.h"
#include "model/errc.h"

#include <seastar/core/coroutine.hh>

namespace chunk {

ss::future<result<chunk_index>> chunk_reader::fetch_index(
  const model::partition_key& key, model::offset chunk_start) {
    auto index_key = remote_index_key(_cfg.prefix, key, chunk_start);
    auto idx = co_await download_index(
      _client, _cfg.bucket, index_key, _cfg.timeout);
    if (idx.has_error()) {
        co_return idx.error();
    }
    if (idx.value().start_offset() != chunk_start) {
        vlog(
          chunk_log.error,
          "{} - index {} starts at {}, expected {}",
          key,
          index_key,
          idx.value().start_offset(),
          chunk_start);
        co_return model::errc::corrupted_chunk;
    }
    co_return std::move(idx.value());
}

ss::future<result<std::vector<model::record>>> chunk_reader::read(
  const model::partition_key& key,
  model::offset chunk_start,
  model::offset from,
  size_t max_records) {
    auto idx = co_await fetch_index(key, chunk_start);
    if (idx.has_error()) {
        co_return idx.error();
    }
    std::vector<model::record> records;
    auto pos = idx.value().locate(from);
    if (!pos.has_value()) {
        vlog(
          chunk_log.debug,
          "{} - offset {} is outside of chunk {}",
          key,
          from,
          idx.value());
        co_return records;
    }

    auto data_key = remote_data_key(_cfg.prefix, key, chunk_start);
    auto head = co_await remote_call(
      _cfg.timeout, _client.head_object(_cfg.bucket, data_key, _cfg.timeout));
    if (head.has_error()) {
        co_return head.error();
    }
    if (head.value().object_size != idx.value().total_bytes()) {
        vlog(
          chunk_log.error,
          "{} - data object {} has {} bytes, index covers {}",
          key,
          data_key,
          head.value().object_size,
          idx.value().total_bytes());
        co_return model::errc::corrupted_chunk;
    }

    const auto& segments = idx.value().segments();
    auto skip = static_cast<size_t>(from() - pos->first_offset());
    uint64_t file_pos = pos->file_pos;
    for (size_t i = pos->segment;
         i < segments.size() && records.size() < max_records;
         ++i) {
        const auto& entry = segments[i];
        auto segment_pos = file_pos;
        file_pos += entry.byte_length;
        if (entry.record_count == 0) {
            continue;
        }
        auto decoded = co_await read_segment(data_key, entry, segment_pos);
        if (decoded.has_error()) {
            co_return decoded.error();
        }
        auto& batch = decoded.value();
        for (size_t r = skip;
             r < batch.size() && records.size() < max_records;
             ++r) {
            records.push_back(std::move(batch[r]));
        }
        skip = 0;
    }
    vlog(
      chunk_log.debug,
      "{} - read {} records from {} starting at offset {}",
      key,
      records.size(),
      data_key,
      from);
    co_return records;
}

ss::future<result<std::vector<model::record>>> chunk_reader::read_segment(
  const object_store::object_key& data_key,
  const segment_entry& entry,
  uint64_t file_pos) {
    auto buf = co_await remote_call(
      _cfg.timeout,
      _client.get_object(
        _cfg.bucket,
        data_key,
        _cfg.timeout,
        false,
        object_store::byte_range{file_pos, file_pos + entry.byte_length - 1}));
    if (buf.has_error()) {
        co_return buf.error();
    }
    if (buf.value().size() != entry.byte_length) {
        vlog(
          chunk_log.error,
          "Segment of {} at {} has {} bytes, index expects {}",
          data_key,
          file_pos,
          buf.value().size(),
          entry.byte_length);
        co_return model::errc::corrupted_chunk;
    }

    ss::temporary_buffer<char> raw;
    try {
        raw = compression::gzip_uncompress(buf.value().get(), buf.value().size());
    } catch (const compression::gzip_error& e) {
        vlog(
          chunk_log.error,
          "Segment of {} at {} can't be decompressed: {}",
          data_key,
          file_pos,
          e.what());
        co_return model::errc::corrupted_chunk;
    }
    if (raw.size() != entry.uncompressed_length) {
        vlog(
          chunk_log.error,
          "Segment of {} at {} inflates to {} bytes, index expects {}",
          data_key,
          file_pos,
          raw.size(),
          entry.uncompressed_length);
        co_return model::errc::corrupted_chunk;
    }

    auto decoded = _codec.decode(raw.get(), raw.size());
    if (decoded.has_error()) {
        co_return decoded.error();
    }
    if (decoded.value().size() != entry.record_count) {
        vlog(
          chunk_log.error,
          "Segment of {} at {} holds {} records, index expects {}",
          data_key,
          file_pos,
          decoded.value().size(),
          entry.record_count);
        co_return model::errc::corrupted_chunk;
    }
    co_return std::move(decoded.value());
}

} // namespace chunk
