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
#include "base/units.h"

#include <seastar/core/temporary_buffer.hh>

#include <zlib.h>

#include <stdexcept>
#include <vector>

namespace compression {

using buffer_list = std::vector<ss::temporary_buffer<char>>;

class gzip_error final : public std::runtime_error {
public:
    explicit gzip_error(const std::string& msg)
      : std::runtime_error(msg) {}
};

/// Streaming gzip compressor producing one gzip member per segment.
///
/// Bytes passed to compress() belong to the current member. finish() ends the
/// member and resets the stream so that the next compress() call starts a new,
/// independently decompressable member. The concatenation of all members is a
/// valid multi-member gzip file.
class gzip_segment_compressor {
public:
    explicit gzip_segment_compressor(
      int level = Z_DEFAULT_COMPRESSION, size_t chunk_size = 64_KiB);
    gzip_segment_compressor(const gzip_segment_compressor&) = delete;
    gzip_segment_compressor& operator=(const gzip_segment_compressor&) = delete;
    gzip_segment_compressor(gzip_segment_compressor&&) = delete;
    gzip_segment_compressor& operator=(gzip_segment_compressor&&) = delete;
    ~gzip_segment_compressor();

    /// Feed uncompressed bytes, returns whatever compressed output zlib
    /// decided to emit (possibly nothing).
    buffer_list compress(const char* data, size_t size);

    /// Terminate the current member and return its remaining output.
    buffer_list finish();

    /// Uncompressed bytes consumed by the current member.
    size_t member_input_bytes() const { return _member_input; }

private:
    buffer_list drain(int flush);

    z_stream _zs{};
    size_t _chunk_size;
    size_t _member_input{0};
};

/// Inflate a buffer holding one or more complete gzip members.
ss::temporary_buffer<char> gzip_uncompress(const char* data, size_t size);

} // namespace compression
