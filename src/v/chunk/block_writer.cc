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
#include "chunk/block_writer.h"

#include "base/vlog.h"
#include "chunk/logger.h"
#include "chunk/path_utils.h"
#include "model/errc.h"
#include "utils/directory_walker.h"
#include "utils/file_io.h"

#include <seastar/core/coroutine.hh>
#include <seastar/core/file.hh>
#include <seastar/core/fstream.hh>
#include <seastar/core/seastar.hh>

#include <exception>

namespace chunk {

block_writer::block_writer(
  writer_options opts,
  model::partition_key key,
  model::offset start,
  chunk_files files,
  ss::output_stream<char> out)
  : _opts(std::move(opts))
  , _key(std::move(key))
  , _start(start)
  , _files(std::move(files))
  , _out(std::move(out))
  , _index(start) {}

ss::future<result<std::unique_ptr<block_writer>>> block_writer::open(
  writer_options opts,
  model::partition_key key,
  model::offset start,
  ss::temporary_buffer<char> header) {
    chunk_files files{
      .data_path = opts.buffer_dir
                   / std::string_view(local_data_file_name(key, start)),
      .index_path = opts.buffer_dir
                    / std::string_view(local_index_file_name(key, start)),
    };
    auto data_path = files.data_path;

    std::unique_ptr<block_writer> w;
    try {
        co_await ss::recursive_touch_directory(opts.buffer_dir.native());
        // An index left by a previous attempt must not outlive the data file
        // that is about to be truncated.
        co_await remove_if_exists(files.index_path);
        auto flags = ss::open_flags::wo | ss::open_flags::create
                     | ss::open_flags::truncate;
        auto f = co_await ss::open_file_dma(data_path.native(), flags);
        auto out = co_await ss::make_file_output_stream(std::move(f));
        w = std::unique_ptr<block_writer>(new block_writer(
          std::move(opts), key, start, std::move(files), std::move(out)));
    } catch (...) {
        vlog(
          chunk_log.error,
          "{} - failed to create chunk file {} at offset {}: {}",
          key,
          data_path.native(),
          start,
          std::current_exception());
        co_return model::errc::local_io_error;
    }

    if (!header.empty()) {
        if (auto ec = co_await w->append(std::move(header), 0); ec) {
            // discard() logs its own failures
            co_await w->discard().discard_result();
            co_return ec;
        }
    }
    vlog(
      chunk_log.debug,
      "{} - opened chunk file {} at offset {}",
      key,
      data_path.native(),
      start);
    co_return std::move(w);
}

ss::future<std::error_code>
block_writer::append(ss::temporary_buffer<char> bytes, uint32_t record_count) {
    if (auto ec = check_writable("append"); ec) {
        co_return ec;
    }
    try {
        if (
          _segment_records > 0
          && _compressor.member_input_bytes() > _opts.segment_threshold) {
            co_await seal_segment();
        }
        if (!bytes.empty()) {
            auto out = _compressor.compress(bytes.get(), bytes.size());
            co_await write_compressed(std::move(out));
        }
        _segment_records += record_count;
        _record_count += record_count;
    } catch (...) {
        vlog(
          chunk_log.error,
          "{} - failed to append to chunk {} at offset {}: {}",
          _key,
          _files.data_path.native(),
          _start + model::offset(_record_count),
          std::current_exception());
        _failed = true;
        co_return model::errc::local_io_error;
    }
    co_return std::error_code{};
}

ss::future<result<chunk_files>>
block_writer::finalize(ss::temporary_buffer<char> trailer) {
    if (auto ec = check_writable("finalize"); ec) {
        co_return ec;
    }
    try {
        if (!trailer.empty()) {
            auto out = _compressor.compress(trailer.get(), trailer.size());
            co_await write_compressed(std::move(out));
        }
        co_await seal_segment();
        co_await close_output();
        co_await write_fully(_files.index_path, _index.serialize());
    } catch (...) {
        vlog(
          chunk_log.error,
          "{} - failed to finalize chunk {} at offset {}: {}",
          _key,
          _files.data_path.native(),
          _start,
          std::current_exception());
        _failed = true;
        co_return model::errc::local_io_error;
    }
    _finalized = true;
    vlog(
      chunk_log.debug,
      "{} - finalized chunk {}: {}",
      _key,
      _files.data_path.native(),
      _index);
    co_return _files;
}

ss::future<std::error_code> block_writer::discard() {
    std::error_code ec;
    _finalized = true;
    try {
        co_await close_output();
    } catch (...) {
        vlog(
          chunk_log.warn,
          "{} - failed to close chunk {}: {}",
          _key,
          _files.data_path.native(),
          std::current_exception());
        ec = model::errc::local_io_error;
    }
    for (const auto& p : {_files.data_path, _files.index_path}) {
        try {
            co_await remove_if_exists(p);
        } catch (...) {
            vlog(
              chunk_log.warn,
              "{} - failed to remove {}: {}",
              _key,
              p.native(),
              std::current_exception());
            ec = model::errc::local_io_error;
        }
    }
    co_return ec;
}

ss::future<std::error_code> block_writer::remove_stale(
  std::filesystem::path buffer_dir, model::partition_key key) {
    std::vector<std::filesystem::path> stale;
    try {
        if (!co_await ss::file_exists(buffer_dir.native())) {
            co_return std::error_code{};
        }
        co_await directory_walker::walk(
          buffer_dir.native(),
          [&stale, &buffer_dir, &key](ss::directory_entry de) {
              if (
                de.type == ss::directory_entry_type::regular
                && is_local_chunk_file(de.name, key)) {
                  stale.push_back(buffer_dir / de.name.c_str());
              }
              return ss::now();
          });
        for (const auto& p : stale) {
            vlog(chunk_log.info, "{} - removing stale file {}", key, p.native());
            co_await ss::remove_file(p.native());
        }
    } catch (...) {
        vlog(
          chunk_log.error,
          "{} - failed to remove stale chunk files in {}: {}",
          key,
          buffer_dir.native(),
          std::current_exception());
        co_return model::errc::local_io_error;
    }
    co_return std::error_code{};
}

std::error_code
block_writer::check_writable(std::string_view operation) const {
    if (_failed) {
        vlog(
          chunk_log.error,
          "{} - {} of chunk {} after a write failure",
          _key,
          operation,
          _files.data_path.native());
        return model::errc::local_io_error;
    }
    if (_finalized) {
        vlog(
          chunk_log.error,
          "{} - {} of finalized chunk {}",
          _key,
          operation,
          _files.data_path.native());
        return model::errc::writer_finalized;
    }
    return {};
}

ss::future<> block_writer::write_compressed(compression::buffer_list bufs) {
    for (auto& b : bufs) {
        _segment_bytes += b.size();
        co_await _out.write(std::move(b));
    }
}

ss::future<> block_writer::seal_segment() {
    auto uncompressed = _compressor.member_input_bytes();
    if (uncompressed == 0) {
        // nothing was fed into the current member
        co_return;
    }
    co_await write_compressed(_compressor.finish());
    _index.add_segment(segment_entry{
      .byte_length = _segment_bytes,
      .record_count = _segment_records,
      .uncompressed_length = uncompressed});
    vlog(
      chunk_log.trace,
      "{} - sealed segment {} of {}: {} records, {} bytes ({} uncompressed)",
      _key,
      _index.segments().size() - 1,
      _files.data_path.native(),
      _segment_records,
      _segment_bytes,
      uncompressed);
    _segment_bytes = 0;
    _segment_records = 0;
}

ss::future<> block_writer::close_output() {
    if (_out_closed) {
        return ss::now();
    }
    _out_closed = true;
    return _out.close();
}

} // namespace chunk
