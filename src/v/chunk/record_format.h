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

#include <seastar/core/sstring.hh>
#include <seastar/core/temporary_buffer.hh>

#include <fmt/core.h>

#include <iosfwd>
#include <memory>
#include <string_view>
#include <vector>

namespace chunk {

enum class format_type { binary, text };

std::ostream& operator<<(std::ostream&, format_type);

struct format_options {
    format_type type{format_type::binary};
    // text format only
    bool include_keys{false};
    ss::sstring key_delimiter{"\t"};
    ss::sstring value_delimiter{"\n"};
};

/// Serialization of individual records into self-delimiting frames.
///
/// A chunk is the concatenation of an optional header frame, one frame per
/// record and an optional trailer frame. Frames never span a segment boundary
/// so any segment of a chunk can be decoded on its own.
class record_format {
public:
    record_format() = default;
    record_format(const record_format&) = delete;
    record_format& operator=(const record_format&) = delete;
    record_format(record_format&&) = delete;
    record_format& operator=(record_format&&) = delete;
    virtual ~record_format() = default;

    virtual std::string_view name() const = 0;

    /// Header frame of a chunk, may be empty.
    virtual ss::temporary_buffer<char>
    encode_header(const model::partition_key& key, model::offset start) const
      = 0;

    /// Trailer frame of a chunk holding 'record_count' records, may be empty.
    virtual ss::temporary_buffer<char>
    encode_trailer(int64_t record_count) const = 0;

    /// Serialize a single record. Fails with errc::serialization_error if the
    /// record can't be represented.
    virtual result<ss::temporary_buffer<char>>
    encode_record(const model::record& r) const = 0;

    /// Decode every record frame found in 'data'. Header and trailer frames
    /// are skipped. Fails with errc::corrupted_chunk on malformed input.
    virtual result<std::vector<model::record>>
    decode(const char* data, size_t size) const = 0;
};

/// Tagged little-endian frames:
///   'H' magic:u32 version:u16 stream_len:u16 stream partition:i32 start:i64
///   'R' key_len:u32 key value_len:u32 value    (0xFFFFFFFF for absent)
///   'T' record_count:i64
class binary_record_format final : public record_format {
public:
    static constexpr uint32_t magic = 0x48435643; // "CVCH"
    static constexpr uint16_t version = 1;
    static constexpr uint32_t absent_length = 0xFFFFFFFF;

    static constexpr char header_tag = 'H';
    static constexpr char record_tag = 'R';
    static constexpr char trailer_tag = 'T';

    std::string_view name() const final { return "binary"; }

    ss::temporary_buffer<char> encode_header(
      const model::partition_key& key, model::offset start) const final;
    ss::temporary_buffer<char> encode_trailer(int64_t record_count) const final;
    result<ss::temporary_buffer<char>>
    encode_record(const model::record& r) const final;
    result<std::vector<model::record>>
    decode(const char* data, size_t size) const final;
};

/// Delimited text, one record per value delimiter:
///   [key key_delimiter] value value_delimiter
/// Records without a value, and keys or values containing a delimiter, are
/// rejected.
class text_record_format final : public record_format {
public:
    text_record_format(
      bool include_keys, ss::sstring key_delimiter, ss::sstring value_delimiter);

    std::string_view name() const final { return "text"; }

    ss::temporary_buffer<char>
    encode_header(const model::partition_key&, model::offset) const final {
        return {};
    }
    ss::temporary_buffer<char> encode_trailer(int64_t) const final {
        return {};
    }
    result<ss::temporary_buffer<char>>
    encode_record(const model::record& r) const final;
    result<std::vector<model::record>>
    decode(const char* data, size_t size) const final;

private:
    bool _include_keys;
    ss::sstring _key_delimiter;
    ss::sstring _value_delimiter;
};

std::unique_ptr<record_format> make_record_format(const format_options&);

} // namespace chunk

template<>
struct fmt::formatter<chunk::format_type> : fmt::formatter<std::string_view> {
    template<typename FormatContext>
    auto format(chunk::format_type t, FormatContext& ctx) const {
        return fmt::formatter<std::string_view>::format(
          t == chunk::format_type::binary ? "binary" : "text", ctx);
    }
};
