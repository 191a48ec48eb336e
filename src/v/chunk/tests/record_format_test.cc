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
#include "chunk/chunk_codec.h"
#include "chunk/record_format.h"
#include "model/errc.h"

#include <seastar/core/byteorder.hh>

#include <gtest/gtest.h>

#include <string>

namespace {

const model::partition_key pk{model::stream_name("orders"), model::partition_id(3)};

model::record
rec(std::optional<ss::sstring> key, std::optional<ss::sstring> value) {
    return model::record{.key = std::move(key), .value = std::move(value)};
}

std::string to_string(const ss::temporary_buffer<char>& b) {
    return {b.get(), b.size()};
}

std::string concat(const chunk::encoded_batch& batch) {
    std::string out;
    for (const auto& f : batch.frames) {
        out += to_string(f);
    }
    return out;
}

} // namespace

TEST(BinaryRecordFormat, AbsentAndEmptyFieldsSurviveDecoding) {
    chunk::binary_record_format fmt;
    chunk::chunk_codec codec(fmt);
    std::vector<model::record> records{
      rec("k1", "v1"),
      rec(std::nullopt, "no key"),
      rec("tombstone", std::nullopt),
      rec("", ""),
      rec(ss::sstring("bin\0ary", 7), ss::sstring("\t\n\xff", 3)),
    };

    auto state = codec.open(pk, model::offset(100));
    auto encoded = codec.encode(state, records);
    ASSERT_TRUE(encoded.has_value());
    ASSERT_EQ(encoded.value().frames.size(), records.size());
    EXPECT_EQ(state.record_count, 5);

    auto bytes = to_string(state.header) + concat(encoded.value())
                 + to_string(codec.close(state));
    auto decoded = codec.decode(bytes.data(), bytes.size());
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded.value(), records);
}

TEST(BinaryRecordFormat, FrameLayout) {
    chunk::binary_record_format fmt;

    auto header = fmt.encode_header(pk, model::offset(42));
    ASSERT_EQ(header.size(), 1 + 4 + 2 + 2 + 6 + 4 + 8);
    EXPECT_EQ(header[0], 'H');
    EXPECT_EQ(
      ss::read_le<uint32_t>(header.get() + 1),
      chunk::binary_record_format::magic);
    EXPECT_EQ(ss::read_le<int64_t>(header.get() + header.size() - 8), 42);

    auto frame = fmt.encode_record(rec(std::nullopt, "abc"));
    ASSERT_TRUE(frame.has_value());
    auto& f = frame.value();
    ASSERT_EQ(f.size(), 1 + 4 + 4 + 3);
    EXPECT_EQ(f[0], 'R');
    EXPECT_EQ(ss::read_le<uint32_t>(f.get() + 1), 0xFFFFFFFF);
    EXPECT_EQ(ss::read_le<uint32_t>(f.get() + 5), 3u);
    EXPECT_EQ(std::string(f.get() + 9, 3), "abc");

    auto trailer = fmt.encode_trailer(7);
    ASSERT_EQ(trailer.size(), 9u);
    EXPECT_EQ(trailer[0], 'T');
    EXPECT_EQ(ss::read_le<int64_t>(trailer.get() + 1), 7);
}

TEST(BinaryRecordFormat, TruncatedFrameIsCorruption) {
    chunk::binary_record_format fmt;
    auto frame = fmt.encode_record(rec("key", "value"));
    ASSERT_TRUE(frame.has_value());
    auto bytes = to_string(frame.value());
    auto decoded = fmt.decode(bytes.data(), bytes.size() - 1);
    ASSERT_TRUE(decoded.has_error());
    EXPECT_EQ(decoded.error(), model::errc::corrupted_chunk);

    std::string garbage = "X123";
    decoded = fmt.decode(garbage.data(), garbage.size());
    ASSERT_TRUE(decoded.has_error());
    EXPECT_EQ(decoded.error(), model::errc::corrupted_chunk);
}

TEST(TextRecordFormat, WritesDelimitedRecords) {
    chunk::text_record_format with_keys(true, "\t", "\n");
    auto f = with_keys.encode_record(rec("user-1", "{\"a\":1}"));
    ASSERT_TRUE(f.has_value());
    EXPECT_EQ(to_string(f.value()), "user-1\t{\"a\":1}\n");

    // an absent key is written as an empty one
    f = with_keys.encode_record(rec(std::nullopt, "v"));
    ASSERT_TRUE(f.has_value());
    EXPECT_EQ(to_string(f.value()), "\tv\n");

    chunk::text_record_format values_only(false, "\t", "|");
    f = values_only.encode_record(rec("ignored\n", "v"));
    ASSERT_TRUE(f.has_value());
    EXPECT_EQ(to_string(f.value()), "v|");

    EXPECT_EQ(to_string(with_keys.encode_header(pk, model::offset(0))), "");
    EXPECT_EQ(to_string(with_keys.encode_trailer(10)), "");
}

TEST(TextRecordFormat, RejectsRecordsThatCantBeDelimited) {
    chunk::text_record_format fmt(true, "\t", "\n");
    for (const auto& bad : {
           rec("k", std::nullopt),
           rec("k", "line\nbreak"),
           rec("k\tk", "v"),
           rec("k\nk", "v"),
         }) {
        auto f = fmt.encode_record(bad);
        ASSERT_TRUE(f.has_error());
        EXPECT_EQ(f.error(), model::errc::serialization_error);
    }
    // a key delimiter inside the value is unambiguous
    EXPECT_TRUE(fmt.encode_record(rec("k", "a\tb")).has_value());
}

TEST(TextRecordFormat, DecodeSplitsOnFirstKeyDelimiter) {
    chunk::text_record_format fmt(true, "::", "\r\n");
    std::string bytes = "a::b::c\r\n::empty key\r\n";
    auto decoded = fmt.decode(bytes.data(), bytes.size());
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(
      decoded.value(),
      (std::vector<model::record>{rec("a", "b::c"), rec("", "empty key")}));

    std::string partial = "a::b\r\nc::d";
    decoded = fmt.decode(partial.data(), partial.size());
    ASSERT_TRUE(decoded.has_error());
    EXPECT_EQ(decoded.error(), model::errc::corrupted_chunk);
}

TEST(ChunkCodec, MalformedRecordRejectsWholeBatch) {
    chunk::text_record_format fmt(false, "\t", "\n");
    chunk::chunk_codec codec(fmt);
    auto state = codec.open(pk, model::offset(0));

    std::vector<model::record> batch{rec("a", "ok"), rec("b", std::nullopt)};
    auto encoded = codec.encode(state, batch);
    ASSERT_TRUE(encoded.has_error());
    EXPECT_EQ(encoded.error(), model::errc::serialization_error);
    EXPECT_EQ(state.record_count, 0);

    std::vector<model::record> good{rec("a", "ok"), rec("b", "ok too")};
    encoded = codec.encode(state, good);
    ASSERT_TRUE(encoded.has_value());
    EXPECT_EQ(state.record_count, 2);
    EXPECT_EQ(concat(encoded.value()), "ok\nok too\n");
}

TEST(ChunkCodec, FactoryHonoursOptions) {
    auto binary = chunk::make_record_format({});
    EXPECT_EQ(binary->name(), "binary");

    auto text = chunk::make_record_format(
      {.type = chunk::format_type::text,
       .include_keys = true,
       .key_delimiter = ",",
       .value_delimiter = ";"});
    EXPECT_EQ(text->name(), "text");
    auto f = text->encode_record(rec("k", "v"));
    ASSERT_TRUE(f.has_value());
    EXPECT_EQ(to_string(f.value()), "k,v;");
}
