// Copyright 2024 Redpanda Data, Inc.
//
// Use of this software is governed by the Business Source License
// included in the file licenses/BSL.md
//
// As of the Change Date specified in that file, in accordance with
// the Business Source License, use of this software will be governed
// by the Apache License, Version 2.0

#include "compression/gzip_segment_compressor.h"

#include <fmt/format.h>

#include <vector>

namespace compression {

namespace {
// 15 bits of window plus 16 selects the gzip wrapper, plus 32 lets inflate
// auto-detect the header.
constexpr int gzip_window_bits = 15 + 16;
constexpr int inflate_window_bits = 15 + 32;
constexpr int default_mem_level = 8;
} // namespace

gzip_segment_compressor::gzip_segment_compressor(int level, size_t chunk_size)
  : _chunk_size(chunk_size) {
    if (auto ret = deflateInit2(
          &_zs,
          level,
          Z_DEFLATED,
          gzip_window_bits,
          default_mem_level,
          Z_DEFAULT_STRATEGY);
        ret != Z_OK) {
        throw gzip_error(
          fmt::format("deflateInit2 failed: {}", zError(ret)));
    }
}

gzip_segment_compressor::~gzip_segment_compressor() { deflateEnd(&_zs); }

buffer_list gzip_segment_compressor::compress(const char* data, size_t size) {
    // zlib never writes through next_in
    _zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data));
    _zs.avail_in = static_cast<uInt>(size);
    _member_input += size;
    return drain(Z_NO_FLUSH);
}

buffer_list gzip_segment_compressor::finish() {
    _zs.next_in = nullptr;
    _zs.avail_in = 0;
    auto out = drain(Z_FINISH);
    if (auto ret = deflateReset(&_zs); ret != Z_OK) {
        throw gzip_error(fmt::format("deflateReset failed: {}", zError(ret)));
    }
    _member_input = 0;
    return out;
}

buffer_list gzip_segment_compressor::drain(int flush) {
    buffer_list out;
    int ret = Z_OK;
    do {
        ss::temporary_buffer<char> chunk(_chunk_size);
        _zs.next_out = reinterpret_cast<Bytef*>(chunk.get_write());
        _zs.avail_out = static_cast<uInt>(chunk.size());
        ret = deflate(&_zs, flush);
        if (ret == Z_STREAM_ERROR) {
            throw gzip_error("deflate failed: inconsistent stream state");
        }
        auto produced = chunk.size() - _zs.avail_out;
        if (produced > 0) {
            chunk.trim(produced);
            out.push_back(std::move(chunk));
        }
    } while (flush == Z_FINISH ? ret != Z_STREAM_END : _zs.avail_out == 0);
    return out;
}

ss::temporary_buffer<char> gzip_uncompress(const char* data, size_t size) {
    z_stream zs{};
    if (auto ret = inflateInit2(&zs, inflate_window_bits); ret != Z_OK) {
        throw gzip_error(fmt::format("inflateInit2 failed: {}", zError(ret)));
    }
    zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data));
    zs.avail_in = static_cast<uInt>(size);

    std::vector<char> out;
    std::vector<char> scratch(64_KiB);
    int ret = Z_OK;
    while (true) {
        zs.next_out = reinterpret_cast<Bytef*>(scratch.data());
        zs.avail_out = static_cast<uInt>(scratch.size());
        ret = inflate(&zs, Z_NO_FLUSH);
        if (ret != Z_OK && ret != Z_STREAM_END) {
            inflateEnd(&zs);
            throw gzip_error(fmt::format("inflate failed: {}", zError(ret)));
        }
        auto produced = scratch.size() - zs.avail_out;
        out.insert(out.end(), scratch.data(), scratch.data() + produced);
        if (ret == Z_STREAM_END) {
            if (zs.avail_in == 0) {
                break;
            }
            // next gzip member
            if (auto r = inflateReset(&zs); r != Z_OK) {
                inflateEnd(&zs);
                throw gzip_error(
                  fmt::format("inflateReset failed: {}", zError(r)));
            }
        } else if (zs.avail_in == 0 && zs.avail_out != 0) {
            inflateEnd(&zs);
            throw gzip_error("truncated gzip input");
        }
    }
    inflateEnd(&zs);
    return {out.data(), out.size()};
}

} // namespace compression
