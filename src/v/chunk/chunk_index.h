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
#include "model/fundamental.h"

#include <seastar/core/temporary_buffer.hh>

#include <fmt/core.h>

#include <iosfwd>
#include <optional>
#include <vector>

namespace chunk {

/// One gzip member of the chunk data file.
struct segment_entry {
    // Compressed size, the length of the member in the data file.
    uint64_t byte_length{0};
    uint32_t record_count{0};
    uint64_t uncompressed_length{0};

    bool operator==(const segment_entry&) const = default;
};

/// Byte/record index of a chunk.
///
/// The serialized form is little-endian:
///
///   "CVIX" version:u16 start_offset:i64 segment_count:u32
///   segment_count * { byte_length:u64 record_count:u32 uncompressed:u64 }
///   crc32:u32 (zlib crc32 of every preceding byte)
///
/// Segment i starts at file position sum(byte_length[0..i)) and its first
/// record has offset start_offset + sum(record_count[0..i)).
class chunk_index {
public:
    static constexpr uint32_t magic = 0x58495643; // "CVIX"
    static constexpr uint16_t version = 1;
    static constexpr size_t header_size = 4 + 2 + 8 + 4;
    static constexpr size_t entry_size = 8 + 4 + 8;
    static constexpr size_t footer_size = 4;

    chunk_index() = default;
    explicit chunk_index(model::offset start)
      : _start(start) {}

    void add_segment(segment_entry e);

    model::offset start_offset() const { return _start; }
    const std::vector<segment_entry>& segments() const { return _segments; }

    int64_t total_records() const { return _total_records; }
    uint64_t total_bytes() const { return _total_bytes; }
    uint64_t total_uncompressed_bytes() const { return _total_uncompressed; }

    /// Offset of the first record of the chunk that follows this one.
    model::offset next_offset() const {
        return _start + model::offset(_total_records);
    }

    struct segment_position {
        size_t segment;
        // position of the gzip member in the data file
        uint64_t file_pos;
        uint64_t byte_length;
        // offset of the first record stored in the segment
        model::offset first_offset;
    };

    /// Segment holding offset 'o', nullopt if 'o' is outside of the chunk.
    std::optional<segment_position> locate(model::offset o) const;

    ss::temporary_buffer<char> serialize() const;
    static result<chunk_index> parse(const char* data, size_t size);

    static size_t serialized_size(size_t segment_count) {
        return header_size + segment_count * entry_size + footer_size;
    }

    bool operator==(const chunk_index&) const = default;

private:
    model::offset _start{0};
    std::vector<segment_entry> _segments;
    int64_t _total_records{0};
    uint64_t _total_bytes{0};
    uint64_t _total_uncompressed{0};
};

std::ostream& operator<<(std::ostream&, const chunk_index&);

} // namespace chunk

template<>
struct fmt::formatter<chunk::chunk_index> : fmt::formatter<std::string_view> {
    template<typename FormatContext>
    auto format(const chunk::chunk_index& idx, FormatContext& ctx) const {
        return fmt::format_to(
          ctx.out(),
          "{{start: {}, segments: {}, records: {}, bytes: {}}}",
          idx.start_offset(),
          idx.segments().size(),
          idx.total_records(),
          idx.total_bytes());
    }
};
