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
#include "chunk/record_format.h"

#include "base/vlog.h"
#include "chunk/logger.h"
#include "model/errc.h"

#include <seastar/core/byteorder.hh>

#include <cstring>
#include <functional>
#include <ostream>

namespace chunk {

std::ostream& operator<<(std::ostream& o, format_type t) {
    switch (t) {
    case format_type::binary:
        return o << "binary";
    case format_type::text:
        return o << "text";
    }
    return o << "unknown";
}

namespace {

/// Sequential writer over a buffer allocated to the exact frame size.
class frame_builder {
public:
    explicit frame_builder(size_t size)
      : _buf(size) {}

    void put_byte(char c) { *_pos++ = c; }

    template<typename T>
    void put_le(T v) {
        ss::write_le<T>(_pos, v);
        _pos += sizeof(T);
    }

    void put_bytes(std::string_view s) {
        std::memcpy(_pos, s.data(), s.size());
        _pos += s.size();
    }

    ss::temporary_buffer<char> release() && { return std::move(_buf); }

private:
    ss::temporary_buffer<char> _buf;
    char* _pos{_buf.get_write()};
};

/// Bounds checked reader used by the binary decoder.
class frame_parser {
public:
    frame_parser(const char* data, size_t size)
      : _data(data)
      , _size(size) {}

    bool at_end() const { return _pos == _size; }
    size_t position() const { return _pos; }
    bool has(size_t n) const { return _size - _pos >= n; }

    char get_byte() { return _data[_pos++]; }

    template<typename T>
    T get_le() {
        auto v = ss::read_le<T>(_data + _pos);
        _pos += sizeof(T);
        return v;
    }

    std::string_view get_bytes(size_t n) {
        std::string_view s(_data + _pos, n);
        _pos += n;
        return s;
    }

private:
    const char* _data;
    size_t _size;
    size_t _pos{0};
};

constexpr size_t header_fixed_size = 1 + sizeof(uint32_t) + sizeof(uint16_t)
                                     + sizeof(uint16_t) + sizeof(int32_t)
                                     + sizeof(int64_t);
constexpr size_t trailer_size = 1 + sizeof(int64_t);

size_t field_size(const std::optional<ss::sstring>& f) {
    return sizeof(uint32_t) + (f.has_value() ? f->size() : 0);
}

bool contains(const ss::sstring& s, std::string_view needle) {
    return std::string_view(s).find(needle) != std::string_view::npos;
}

} // namespace

ss::temporary_buffer<char> binary_record_format::encode_header(
  const model::partition_key& key, model::offset start) const {
    std::string_view stream = key.stream();
    frame_builder b(header_fixed_size + stream.size());
    b.put_byte(header_tag);
    b.put_le<uint32_t>(magic);
    b.put_le<uint16_t>(version);
    b.put_le<uint16_t>(static_cast<uint16_t>(stream.size()));
    b.put_bytes(stream);
    b.put_le<int32_t>(key.partition());
    b.put_le<int64_t>(start());
    return std::move(b).release();
}

ss::temporary_buffer<char>
binary_record_format::encode_trailer(int64_t record_count) const {
    frame_builder b(trailer_size);
    b.put_byte(trailer_tag);
    b.put_le<int64_t>(record_count);
    return std::move(b).release();
}

result<ss::temporary_buffer<char>>
binary_record_format::encode_record(const model::record& r) const {
    for (const auto& f : {std::cref(r.key), std::cref(r.value)}) {
        if (f.get().has_value() && f.get()->size() >= absent_length) {
            vlog(
              chunk_log.error,
              "Record field of {} bytes exceeds the binary format limit",
              f.get()->size());
            return model::errc::serialization_error;
        }
    }
    frame_builder b(1 + field_size(r.key) + field_size(r.value));
    b.put_byte(record_tag);
    for (const auto& f : {std::cref(r.key), std::cref(r.value)}) {
        if (f.get().has_value()) {
            b.put_le<uint32_t>(static_cast<uint32_t>(f.get()->size()));
            b.put_bytes(*f.get());
        } else {
            b.put_le<uint32_t>(absent_length);
        }
    }
    return std::move(b).release();
}

result<std::vector<model::record>>
binary_record_format::decode(const char* data, size_t size) const {
    std::vector<model::record> records;
    frame_parser p(data, size);

    auto read_field = [&p]() -> std::optional<std::optional<ss::sstring>> {
        if (!p.has(sizeof(uint32_t))) {
            return std::nullopt;
        }
        auto len = p.get_le<uint32_t>();
        if (len == absent_length) {
            return std::optional<ss::sstring>{};
        }
        if (!p.has(len)) {
            return std::nullopt;
        }
        auto bytes = p.get_bytes(len);
        return std::optional<ss::sstring>(
          ss::sstring(bytes.data(), bytes.size()));
    };

    while (!p.at_end()) {
        auto frame_start = p.position();
        auto tag = p.get_byte();
        bool ok = true;
        switch (tag) {
        case header_tag: {
            if (!p.has(header_fixed_size - 1)) {
                ok = false;
                break;
            }
            auto m = p.get_le<uint32_t>();
            auto v = p.get_le<uint16_t>();
            auto stream_len = p.get_le<uint16_t>();
            if (m != magic || v != version) {
                vlog(
                  chunk_log.error,
                  "Unexpected chunk header at {}: magic {:#x}, version {}",
                  frame_start,
                  m,
                  v);
                return model::errc::corrupted_chunk;
            }
            if (!p.has(stream_len + sizeof(int32_t) + sizeof(int64_t))) {
                ok = false;
                break;
            }
            p.get_bytes(stream_len);
            p.get_le<int32_t>();
            p.get_le<int64_t>();
            break;
        }
        case record_tag: {
            auto key = read_field();
            if (!key) {
                ok = false;
                break;
            }
            auto value = read_field();
            if (!value) {
                ok = false;
                break;
            }
            records.push_back(
              model::record{.key = std::move(*key), .value = std::move(*value)});
            break;
        }
        case trailer_tag:
            if (!p.has(sizeof(int64_t))) {
                ok = false;
                break;
            }
            p.get_le<int64_t>();
            break;
        default:
            vlog(
              chunk_log.error,
              "Unknown frame tag {:#x} at {}",
              static_cast<uint8_t>(tag),
              frame_start);
            return model::errc::corrupted_chunk;
        }
        if (!ok) {
            vlog(
              chunk_log.error,
              "Truncated frame at {}, {} bytes total",
              frame_start,
              size);
            return model::errc::corrupted_chunk;
        }
    }
    return records;
}

text_record_format::text_record_format(
  bool include_keys, ss::sstring key_delimiter, ss::sstring value_delimiter)
  : _include_keys(include_keys)
  , _key_delimiter(std::move(key_delimiter))
  , _value_delimiter(std::move(value_delimiter)) {}

result<ss::temporary_buffer<char>>
text_record_format::encode_record(const model::record& r) const {
    if (!r.value.has_value()) {
        vlog(chunk_log.error, "Text format can't encode a record without value");
        return model::errc::serialization_error;
    }
    if (contains(*r.value, _value_delimiter)) {
        vlog(chunk_log.error, "Record value contains the value delimiter");
        return model::errc::serialization_error;
    }
    std::string_view key;
    size_t size = r.value->size() + _value_delimiter.size();
    if (_include_keys) {
        if (r.key.has_value()) {
            if (
              contains(*r.key, _key_delimiter)
              || contains(*r.key, _value_delimiter)) {
                vlog(chunk_log.error, "Record key contains a delimiter");
                return model::errc::serialization_error;
            }
            key = *r.key;
        }
        size += key.size() + _key_delimiter.size();
    }
    frame_builder b(size);
    if (_include_keys) {
        b.put_bytes(key);
        b.put_bytes(_key_delimiter);
    }
    b.put_bytes(*r.value);
    b.put_bytes(_value_delimiter);
    return std::move(b).release();
}

result<std::vector<model::record>>
text_record_format::decode(const char* data, size_t size) const {
    std::vector<model::record> records;
    std::string_view rest(data, size);
    while (!rest.empty()) {
        auto end = rest.find(_value_delimiter);
        if (end == std::string_view::npos) {
            vlog(
              chunk_log.error,
              "Text record without value delimiter, {} trailing bytes",
              rest.size());
            return model::errc::corrupted_chunk;
        }
        auto line = rest.substr(0, end);
        rest.remove_prefix(end + _value_delimiter.size());
        model::record r;
        if (_include_keys) {
            auto k = line.find(_key_delimiter);
            if (k == std::string_view::npos) {
                vlog(chunk_log.error, "Text record without key delimiter");
                return model::errc::corrupted_chunk;
            }
            r.key = ss::sstring(line.data(), k);
            line.remove_prefix(k + _key_delimiter.size());
        }
        r.value = ss::sstring(line.data(), line.size());
        records.push_back(std::move(r));
    }
    return records;
}

std::unique_ptr<record_format> make_record_format(const format_options& opts) {
    switch (opts.type) {
    case format_type::binary:
        return std::make_unique<binary_record_format>();
    case format_type::text:
        return std::make_unique<text_record_format>(
          opts.include_keys, opts.key_delimiter, opts.value_delimiter);
    }
    return std::make_unique<binary_record_format>();
}

} // namespace chunk
