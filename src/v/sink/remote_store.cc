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
#include "sink/remote_store.h"

#include "base/vlog.h"
#include "chunk/path_utils.h"
#include "chunk/remote_io.h"
#include "model/errc.h"
#include "sink/logger.h"
#include "utils/file_io.h"
#include "utils/memory_data_source.h"

#include <seastar/core/coroutine.hh>
#include <seastar/core/file.hh>
#include <seastar/core/fstream.hh>
#include <seastar/core/seastar.hh>

#include <map>

namespace sink {

remote_store::remote_store(
  object_store::client& client,
  object_store::bucket_name bucket,
  ss::sstring prefix,
  ss::lowres_clock::duration timeout)
  : _client(client)
  , _bucket(std::move(bucket))
  , _prefix(chunk::normalize_prefix(prefix))
  , _timeout(timeout) {}

ss::future<result<model::offset>> remote_store::commit(
  const chunk::chunk_files& files,
  const model::partition_key& key,
  model::offset start) {
    chunk::chunk_index idx;
    ss::temporary_buffer<char> index_bytes;
    uint64_t data_size = 0;
    try {
        index_bytes = co_await read_fully_tmpbuf(files.index_path);
        auto parsed = chunk::chunk_index::parse(
          index_bytes.get(), index_bytes.size());
        if (parsed.has_error()) {
            vlog(
              sink_log.error,
              "{} - local index {} is corrupted",
              key,
              files.index_path.native());
            co_return model::errc::local_io_error;
        }
        idx = std::move(parsed.value());
        data_size = co_await ss::file_size(files.data_path.native());
    } catch (...) {
        vlog(
          sink_log.error,
          "{} - can't read chunk files {} at offset {}: {}",
          key,
          files.data_path.native(),
          start,
          std::current_exception());
        co_return model::errc::local_io_error;
    }

    if (idx.start_offset() != start) {
        vlog(
          sink_log.error,
          "{} - index {} starts at {}, expected {}",
          key,
          files.index_path.native(),
          idx.start_offset(),
          start);
        co_return model::errc::local_io_error;
    }
    if (data_size != idx.total_bytes()) {
        vlog(
          sink_log.error,
          "{} - data file {} has {} bytes, index covers {}",
          key,
          files.data_path.native(),
          data_size,
          idx.total_bytes());
        co_return model::errc::local_io_error;
    }

    auto data_key = chunk::remote_data_key(_prefix, key, start);
    if (auto ec = co_await upload_file(files.data_path, data_key, data_size);
        ec) {
        co_return ec;
    }
    auto index_key = chunk::remote_index_key(_prefix, key, start);
    auto index_size = index_bytes.size();
    auto r = co_await chunk::remote_call(
      _timeout,
      _client.put_object(
        _bucket,
        index_key,
        index_size,
        make_memory_input_stream(std::move(index_bytes)),
        _timeout));
    if (r.has_error()) {
        vlog(
          sink_log.warn,
          "{} - failed to upload index {}: {}",
          key,
          index_key,
          r.error().message());
        co_return r.error();
    }
    vlog(
      sink_log.info,
      "{} - committed chunk {}, offsets [{}, {}), {} segments, {} bytes",
      key,
      data_key,
      start,
      idx.next_offset(),
      idx.segments().size(),
      data_size);
    co_return idx.next_offset();
}

ss::future<std::error_code> remote_store::upload_file(
  const std::filesystem::path& path,
  const object_store::object_key& key,
  uint64_t size) {
    ss::input_stream<char> body;
    try {
        auto f = co_await ss::open_file_dma(path.native(), ss::open_flags::ro);
        body = ss::make_file_input_stream(std::move(f));
    } catch (...) {
        vlog(
          sink_log.error,
          "Can't open {} for upload: {}",
          path.native(),
          std::current_exception());
        co_return model::errc::local_io_error;
    }
    auto r = co_await chunk::remote_call(
      _timeout,
      _client.put_object(_bucket, key, size, std::move(body), _timeout));
    if (r.has_error()) {
        vlog(
          sink_log.warn,
          "Failed to upload {} to {}: {}",
          path.native(),
          key,
          r.error().message());
        co_return r.error();
    }
    co_return std::error_code{};
}

ss::future<result<model::offset>>
remote_store::resolve_resume_offset(const model::partition_key& key) {
    auto chunks = co_await list_chunks(key);
    if (chunks.has_error()) {
        co_return chunks.error();
    }
    const auto& all = chunks.value();
    for (auto it = all.rbegin(); it != all.rend(); ++it) {
        if (!it->is_complete()) {
            vlog(
              sink_log.warn,
              "{} - skipping partial chunk at offset {} (data: {}, index: {})",
              key,
              it->start,
              it->data_size.has_value(),
              it->index_size.has_value());
            continue;
        }
        auto idx = co_await download_index(key, it->start);
        if (idx.has_error()) {
            if (model::is_retriable(idx.error())) {
                co_return idx.error();
            }
            vlog(
              sink_log.warn,
              "{} - skipping chunk at offset {}: {}",
              key,
              it->start,
              idx.error().message());
            continue;
        }
        if (idx.value().total_bytes() != *it->data_size) {
            vlog(
              sink_log.warn,
              "{} - skipping chunk at offset {}, data object has {} bytes, "
              "index covers {}",
              key,
              it->start,
              *it->data_size,
              idx.value().total_bytes());
            continue;
        }
        auto next = idx.value().next_offset();
        vlog(
          sink_log.info,
          "{} - resuming at offset {} after chunk {}",
          key,
          next,
          idx.value());
        co_return next;
    }
    vlog(sink_log.info, "{} - no complete chunks, starting at offset 0", key);
    co_return model::offset(0);
}

ss::future<result<std::vector<remote_store::remote_chunk>>>
remote_store::list_chunks(const model::partition_key& key) {
    auto prefix = chunk::remote_partition_prefix(_prefix, key);
    std::map<model::offset, remote_chunk> by_start;
    std::optional<ss::sstring> token;
    while (true) {
        auto r = co_await chunk::remote_call(
          _timeout,
          _client.list_objects(
            _bucket,
            object_store::object_key(prefix),
            std::nullopt,
            token,
            _timeout));
        if (r.has_error()) {
            vlog(
              sink_log.warn,
              "{} - failed to list {}: {}",
              key,
              prefix,
              r.error().message());
            co_return r.error();
        }
        for (const auto& item : r.value().contents) {
            std::string_view rest = item.key;
            if (!rest.starts_with(std::string_view(prefix))) {
                continue;
            }
            rest.remove_prefix(prefix.size());
            auto name = rest.find('/') == std::string_view::npos
                          ? chunk::parse_remote_object_name(rest)
                          : std::nullopt;
            if (!name.has_value()) {
                vlog(sink_log.debug, "{} - ignoring object {}", key, item.key);
                continue;
            }
            auto& c = by_start[name->start];
            c.start = name->start;
            if (name->is_index) {
                c.index_size = item.size_bytes;
            } else {
                c.data_size = item.size_bytes;
            }
        }
        if (
          !r.value().is_truncated
          || r.value().next_continuation_token.empty()) {
            break;
        }
        token = r.value().next_continuation_token;
    }

    std::vector<remote_chunk> out;
    out.reserve(by_start.size());
    for (auto& [_, c] : by_start) {
        out.push_back(c);
    }
    co_return out;
}

ss::future<result<chunk::chunk_index>> remote_store::download_index(
  const model::partition_key& key, model::offset start) {
    auto index_key = chunk::remote_index_key(_prefix, key, start);
    auto idx = co_await chunk::download_index(
      _client, _bucket, index_key, _timeout);
    if (idx.has_error()) {
        co_return idx.error();
    }
    if (idx.value().start_offset() != start) {
        vlog(
          sink_log.warn,
          "{} - index {} starts at {}",
          key,
          index_key,
          idx.value().start_offset());
        co_return model::errc::corrupted_chunk;
    }
    co_return std::move(idx.value());
}

ss::future<result<size_t>>
remote_store::remove_partial_chunks(const model::partition_key& key) {
    auto chunks = co_await list_chunks(key);
    if (chunks.has_error()) {
        co_return chunks.error();
    }
    size_t removed = 0;
    for (const auto& c : chunks.value()) {
        if (c.is_complete()) {
            continue;
        }
        auto obj = c.data_size.has_value()
                     ? chunk::remote_data_key(_prefix, key, c.start)
                     : chunk::remote_index_key(_prefix, key, c.start);
        auto r = co_await chunk::remote_call(
          _timeout, _client.delete_object(_bucket, obj, _timeout));
        if (r.has_error()) {
            vlog(
              sink_log.warn,
              "{} - failed to delete {}: {}",
              key,
              obj,
              r.error().message());
            co_return r.error();
        }
        vlog(sink_log.info, "{} - deleted partial chunk object {}", key, obj);
        ++removed;
    }
    co_return removed;
}

} // namespace sink
