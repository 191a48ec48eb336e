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
#include "chunk/chunk_index.h"

#include "base/vlog.h"
#include "chunk/logger.h"
#include "model/errc.h"

#include <seastar/core/byteorder.hh>

#include <fmt/ostream.h>
#include <zlib.h>

#include <ostream>

namespace chunk {

namespace {
uint32_t checksum(const char* data, size_t size) {
    return static_cast<uint32_t>(crc32(
      crc32(0L, Z_NULL, 0),
      reinterpret_cast<const Bytef*>(data),
      static_cast<uInt>(size)));
}
} // namespace

void chunk_index::add_segment(segment_entry e) {
    _total_records += e.record_count;
    _total_bytes += e.byte_length;
    _total_uncompressed += e.uncompressed_length;
    _segments.push_back(e);
}

std::optional<chunk_index::segment_position>
chunk_index::locate(model::offset o) const {
    if (o < _start || o >= next_offset()) {
        return std::nullopt;
    }
    model::offset first = _start;
    uint64_t pos = 0;
    for (size_t i = 0; i < _segments.size(); ++i) {
        const auto& s = _segments[i];
        auto next = first + model::offset(s.record_count);
        if (o < next) {
            return segment_position{
              .segment = i,
              .file_pos = pos,
              .byte_length = s.byte_length,
              .first_offset = first};
        }
        first = next;
        pos += s.byte_length;
    }
    return std::nullopt;
}

ss::temporary_buffer<char> chunk_index::serialize() const {
    ss::temporary_buffer<char> buf(serialized_size(_segments.size()));
    char* p = buf.get_write();
    ss::write_le<uint32_t>(p, magic);
    p += sizeof(uint32_t);
    ss::write_le<uint16_t>(p, version);
    p += sizeof(uint16_t);
    ss::write_le<int64_t>(p, _start());
    p += sizeof(int64_t);
    ss::write_le<uint32_t>(p, static_cast<uint32_t>(_segments.size()));
    p += sizeof(uint32_t);
    for (const auto& s : _segments) {
        ss::write_le<uint64_t>(p, s.byte_length);
        p += sizeof(uint64_t);
        ss::write_le<uint32_t>(p, s.record_count);
        p += sizeof(uint32_t);
        ss::write_le<uint64_t>(p, s.uncompressed_length);
        p += sizeof(uint64_t);
    }
    ss::write_le<uint32_t>(p, checksum(buf.get(), p - buf.get()));
    return buf;
}

result<chunk_index> chunk_index::parse(const char* data, size_t size) {
    if (size < header_size + footer_size) {
        vlog(chunk_log.warn, "Index of {} bytes is too short", size);
        return model::errc::corrupted_chunk;
    }
    const char* p = data;
    auto m = ss::read_le<uint32_t>(p);
    p += sizeof(uint32_t);
    auto v = ss::read_le<uint16_t>(p);
    p += sizeof(uint16_t);
    if (m != magic || v != version) {
        vlog(
          chunk_log.warn,
          "Unexpected index magic {:#x} or version {}",
          m,
          v);
        return model::errc::corrupted_chunk;
    }
    auto start = ss::read_le<int64_t>(p);
    p += sizeof(int64_t);
    auto count = ss::read_le<uint32_t>(p);
    p += sizeof(uint32_t);
    if (size != serialized_size(count)) {
        vlog(
          chunk_log.warn,
          "Index size {} doesn't match its segment count {}",
          size,
          count);
        return model::errc::corrupted_chunk;
    }
    auto expected = ss::read_le<uint32_t>(data + size - footer_size);
    auto actual = checksum(data, size - footer_size);
    if (expected != actual) {
        vlog(
          chunk_log.warn,
          "Index checksum mismatch, expected {:#x}, computed {:#x}",
          expected,
          actual);
        return model::errc::corrupted_chunk;
    }
    chunk_index idx{model::offset(start)};
    for (uint32_t i = 0; i < count; ++i) {
        segment_entry e;
        e.byte_length = ss::read_le<uint64_t>(p);
        p += sizeof(uint64_t);
        e.record_count = ss::read_le<uint32_t>(p);
        p += sizeof(uint32_t);
        e.uncompressed_length = ss::read_le<uint64_t>(p);
        p += sizeof(uint64_t);
        idx.add_segment(e);
    }
    return idx;
}

std::ostream& operator<<(std::ostream& o, const chunk_index& idx) {
    fmt::print(o, "{}", idx);
    return o;
}

} // namespace chunk
