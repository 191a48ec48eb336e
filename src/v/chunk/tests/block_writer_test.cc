// Copyright 2024 Redpanda Data, Inc.
//
// Use of this software is governed by the Business Source License
// included in the file licenses/BSL.md
//
// As of the Change Date specified in that file, in accordance with
// the Business Source License, use of this software will be governed
// by the Apache License, Version 2.0
#include "chunk/block_writer.h"
#include "chunk/chunk_codec.h"
#include "chunk/path_utils.h"
#include "compression/gzip_segment_compressor.h"
#include "model/errc.h"
#include "test_utils/tmp_dir.h"
#include "utils/file_io.h"

#include <seastar/core/seastar.hh>

#include <fmt/format.h>
#include <gtest/gtest.h>

#include <filesystem>

namespace {

const model::partition_key pk{model::stream_name("orders"), model::partition_id(3)};

std::vector<model::record> make_records(size_t n) {
    std::vector<model::record> records;
    for (size_t i = 0; i < n; ++i) {
        records.push_back(model::record{
          .key = ss::sstring(fmt::format("key-{}", i)),
          .value = ss::sstring(fmt::format("value-{:020}", i))});
    }
    return records;
}

class BlockWriterTest : public ::testing::Test {
public:
    chunk::writer_options options(size_t threshold = 64) const {
        return {.buffer_dir = dir.get_path() / "buffer", .segment_threshold = threshold};
    }

    std::unique_ptr<chunk::block_writer>
    open(model::offset start, chunk::writer_options opts) {
        auto state = codec.open(pk, start);
        auto w = chunk::block_writer::open(
                   std::move(opts), pk, start, std::move(state.header))
                   .get();
        if (w.has_error()) {
            throw std::runtime_error(
              fmt::format("open failed: {}", w.error().message()));
        }
        return std::move(w.value());
    }

    /// Encode and append every record on its own, the way a session does.
    void append_all(
      chunk::block_writer& w,
      chunk::codec_state& state,
      const std::vector<model::record>& records) {
        auto encoded = codec.encode(state, records);
        ASSERT_TRUE(encoded.has_value());
        for (auto& f : encoded.value().frames) {
            ASSERT_FALSE(w.append(std::move(f), 1).get());
        }
    }

    temporary_dir dir;
    chunk::binary_record_format format;
    chunk::chunk_codec codec{format};
};

} // namespace

TEST_F(BlockWriterTest, SegmentsDecodeIndependently) {
    auto records = make_records(40);
    auto w = open(model::offset(500), options());
    auto state = codec.open(pk, model::offset(500));
    append_all(*w, state, records);
    EXPECT_EQ(w->record_count(), 40);

    auto files = w->finalize(codec.close(state)).get();
    ASSERT_TRUE(files.has_value());
    EXPECT_TRUE(w->is_finalized());
    EXPECT_EQ(
      files.value().data_path.filename().string(),
      std::string(chunk::local_data_file_name(pk, model::offset(500))));

    const auto& idx = w->index();
    EXPECT_EQ(idx.start_offset(), model::offset(500));
    EXPECT_EQ(idx.total_records(), 40);
    EXPECT_EQ(idx.next_offset(), model::offset(540));
    EXPECT_GT(idx.segments().size(), 1u);

    auto data = read_fully_to_string(files.value().data_path).get();
    ASSERT_EQ(data.size(), idx.total_bytes());

    // every segment is a complete gzip member holding whole records
    std::vector<model::record> decoded;
    uint64_t pos = 0;
    for (const auto& s : idx.segments()) {
        auto raw = compression::gzip_uncompress(
          data.data() + pos, s.byte_length);
        EXPECT_EQ(raw.size(), s.uncompressed_length);
        auto part = codec.decode(raw.get(), raw.size());
        ASSERT_TRUE(part.has_value());
        EXPECT_EQ(part.value().size(), s.record_count);
        decoded.insert(decoded.end(), part.value().begin(), part.value().end());
        pos += s.byte_length;
    }
    EXPECT_EQ(decoded, records);

    // the whole file is a valid multi-member gzip stream as well
    auto whole = compression::gzip_uncompress(data.data(), data.size());
    EXPECT_EQ(whole.size(), idx.total_uncompressed_bytes());

    auto index_bytes = read_fully_to_string(files.value().index_path).get();
    auto parsed = chunk::chunk_index::parse(index_bytes.data(), index_bytes.size());
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed.value(), idx);
}

TEST_F(BlockWriterTest, LargeThresholdKeepsSingleSegment) {
    auto w = open(model::offset(0), options(1_MiB));
    auto state = codec.open(pk, model::offset(0));
    append_all(*w, state, make_records(100));
    auto files = w->finalize(codec.close(state)).get();
    ASSERT_TRUE(files.has_value());
    ASSERT_EQ(w->index().segments().size(), 1u);
    EXPECT_EQ(w->index().segments()[0].record_count, 100u);
}

TEST_F(BlockWriterTest, AppendIsNeverSplit) {
    // a single append far above the threshold stays in one segment
    auto w = open(model::offset(0), options(16));
    std::string big(1000, 'x');
    ASSERT_FALSE(
      w->append(ss::temporary_buffer<char>(big.data(), big.size()), 1).get());
    ASSERT_FALSE(w->append(ss::temporary_buffer<char>("y", 1), 1).get());
    auto files = w->finalize({}).get();
    ASSERT_TRUE(files.has_value());

    const auto& segments = w->index().segments();
    ASSERT_EQ(segments.size(), 2u);
    EXPECT_EQ(segments[0].record_count, 1u);
    EXPECT_GE(segments[0].uncompressed_length, 1000u);
    EXPECT_EQ(segments[1].record_count, 1u);
    EXPECT_EQ(segments[1].uncompressed_length, 1u);
}

TEST_F(BlockWriterTest, FinalizedWriterIsImmutable) {
    auto w = open(model::offset(0), options());
    auto state = codec.open(pk, model::offset(0));
    append_all(*w, state, make_records(3));
    ASSERT_TRUE(w->finalize(codec.close(state)).get().has_value());

    EXPECT_EQ(
      w->append(ss::temporary_buffer<char>("x", 1), 1).get(),
      model::errc::writer_finalized);
    auto again = w->finalize({}).get();
    ASSERT_TRUE(again.has_error());
    EXPECT_EQ(again.error(), model::errc::writer_finalized);
    EXPECT_EQ(w->record_count(), 3);
}

TEST_F(BlockWriterTest, FailedFinalizeLeavesWriterUnusable) {
    auto w = open(model::offset(0), options());
    auto state = codec.open(pk, model::offset(0));
    append_all(*w, state, make_records(3));

    // the index can't be written over a directory
    auto blocker = w->files().index_path;
    ASSERT_TRUE(std::filesystem::create_directory(blocker));
    auto files = w->finalize(codec.close(state)).get();
    ASSERT_TRUE(files.has_error());
    EXPECT_EQ(files.error(), model::errc::local_io_error);
    EXPECT_TRUE(w->has_failed());
    EXPECT_FALSE(w->is_finalized());

    EXPECT_EQ(
      w->append(ss::temporary_buffer<char>("x", 1), 1).get(),
      model::errc::local_io_error);
    auto again = w->finalize({}).get();
    ASSERT_TRUE(again.has_error());
    EXPECT_EQ(again.error(), model::errc::local_io_error);
    EXPECT_EQ(w->record_count(), 3);

    std::filesystem::remove(blocker);
    EXPECT_FALSE(w->discard().get());
    EXPECT_FALSE(ss::file_exists(w->files().data_path.native()).get());
}

TEST_F(BlockWriterTest, DiscardRemovesFiles) {
    auto w = open(model::offset(10), options());
    auto state = codec.open(pk, model::offset(10));
    append_all(*w, state, make_records(5));
    auto files = w->files();
    EXPECT_TRUE(ss::file_exists(files.data_path.native()).get());

    EXPECT_FALSE(w->discard().get());
    EXPECT_FALSE(ss::file_exists(files.data_path.native()).get());
    EXPECT_FALSE(ss::file_exists(files.index_path.native()).get());

    // discarding a finalized writer removes the index too
    auto w2 = open(model::offset(10), options());
    auto state2 = codec.open(pk, model::offset(10));
    append_all(*w2, state2, make_records(5));
    auto f2 = w2->finalize(codec.close(state2)).get();
    ASSERT_TRUE(f2.has_value());
    EXPECT_TRUE(ss::file_exists(f2.value().index_path.native()).get());
    EXPECT_FALSE(w2->discard().get());
    EXPECT_FALSE(ss::file_exists(f2.value().data_path.native()).get());
    EXPECT_FALSE(ss::file_exists(f2.value().index_path.native()).get());
}

TEST_F(BlockWriterTest, EmptyHeaderLeavesEmptyWriter) {
    chunk::text_record_format text(false, "\t", "\n");
    chunk::chunk_codec text_codec(text);
    auto state = text_codec.open(pk, model::offset(0));
    auto w = chunk::block_writer::open(
               options(), pk, model::offset(0), std::move(state.header))
               .get();
    ASSERT_TRUE(w.has_value());
    EXPECT_TRUE(w.value()->is_empty());
    EXPECT_FALSE(w.value()->discard().get());
}

TEST_F(BlockWriterTest, RemoveStaleKeepsOtherPartitions) {
    auto buffer = options().buffer_dir;
    ss::recursive_touch_directory(buffer.native()).get();
    model::partition_key other{model::stream_name("orders"), model::partition_id(4)};
    auto touch = [&buffer](const ss::sstring& name) {
        write_fully(buffer / std::string_view(name), ss::temporary_buffer<char>("x", 1))
          .get();
    };
    touch(chunk::local_data_file_name(pk, model::offset(0)));
    touch(chunk::local_index_file_name(pk, model::offset(0)));
    touch(chunk::local_data_file_name(pk, model::offset(77)));
    touch(chunk::local_data_file_name(other, model::offset(0)));
    touch("unrelated.txt");

    EXPECT_FALSE(chunk::block_writer::remove_stale(buffer, pk).get());

    auto exists = [&buffer](const ss::sstring& name) {
        return ss::file_exists((buffer / std::string_view(name)).native()).get();
    };
    EXPECT_FALSE(exists(chunk::local_data_file_name(pk, model::offset(0))));
    EXPECT_FALSE(exists(chunk::local_index_file_name(pk, model::offset(0))));
    EXPECT_FALSE(exists(chunk::local_data_file_name(pk, model::offset(77))));
    EXPECT_TRUE(exists(chunk::local_data_file_name(other, model::offset(0))));
    EXPECT_TRUE(exists("unrelated.txt"));

    // a missing buffer directory has nothing to clean
    EXPECT_FALSE(
      chunk::block_writer::remove_stale(dir.get_path() / "missing", pk).get());
}
