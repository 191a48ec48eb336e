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
#include "base/units.h"
#include "chunk/chunk_index.h"
#include "compression/gzip_segment_compressor.h"
#include "model/fundamental.h"

#include <seastar/core/future.hh>
#include <seastar/core/iostream.hh>
#include <seastar/core/temporary_buffer.hh>

#include <filesystem>
#include <memory>
#include <string_view>
#include <system_error>

namespace chunk {

struct writer_options {
    std::filesystem::path buffer_dir;
    // A segment is sealed before the next append once its uncompressed size
    // exceeds this value.
    size_t segment_threshold{64_MiB};
};

/// Local files of a finalized chunk.
struct chunk_files {
    std::filesystem::path data_path;
    std::filesystem::path index_path;
};

/// Writes one chunk into a local multi-member gzip file and its index.
///
/// Every segment of the chunk is an independent gzip member, so a reader that
/// knows the member position from the index can decompress it without
/// touching the rest of the file. Segment boundaries are only placed between
/// appends: an append is never split, which makes the threshold a soft bound.
///
/// Lifecycle: open -> append* -> finalize -> discard, or open -> discard.
class block_writer {
public:
    /// Create the chunk files for partition 'key' starting at 'start' and
    /// write 'header' at the beginning of segment 0.
    static ss::future<result<std::unique_ptr<block_writer>>> open(
      writer_options opts,
      model::partition_key key,
      model::offset start,
      ss::temporary_buffer<char> header);

    block_writer(const block_writer&) = delete;
    block_writer& operator=(const block_writer&) = delete;
    block_writer(block_writer&&) = delete;
    block_writer& operator=(block_writer&&) = delete;
    ~block_writer() = default;

    /// Append the encoded frames of 'record_count' records. After a failed
    /// append or finalize the writer refuses everything but discard().
    ss::future<std::error_code>
    append(ss::temporary_buffer<char> bytes, uint32_t record_count);

    /// Write 'trailer', seal the last segment, write the index and close both
    /// files. The writer is immutable afterwards.
    ss::future<result<chunk_files>> finalize(ss::temporary_buffer<char> trailer);

    /// Close and delete the local files. Valid in every state.
    ss::future<std::error_code> discard();

    /// Delete chunk files of partition 'key' left in 'buffer_dir' by a
    /// previous process.
    static ss::future<std::error_code> remove_stale(
      std::filesystem::path buffer_dir, model::partition_key key);

    int64_t record_count() const { return _record_count; }
    bool is_empty() const { return _record_count == 0; }
    bool is_finalized() const { return _finalized; }
    bool has_failed() const { return _failed; }
    model::offset start_offset() const { return _start; }
    const chunk_files& files() const { return _files; }
    /// Index of the sealed segments, complete after finalize.
    const chunk_index& index() const { return _index; }

private:
    block_writer(
      writer_options opts,
      model::partition_key key,
      model::offset start,
      chunk_files files,
      ss::output_stream<char> out);

    ss::future<> write_compressed(compression::buffer_list bufs);
    ss::future<> seal_segment();
    ss::future<> close_output();
    std::error_code check_writable(std::string_view operation) const;

    writer_options _opts;
    model::partition_key _key;
    model::offset _start;
    chunk_files _files;
    ss::output_stream<char> _out;
    bool _out_closed{false};
    compression::gzip_segment_compressor _compressor;
    chunk_index _index;

    // current segment
    uint64_t _segment_bytes{0};
    uint32_t _segment_records{0};

    int64_t _record_count{0};
    bool _finalized{false};
    bool _failed{false};
};

} // namespace chunk
