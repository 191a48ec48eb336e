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
#include "chunk/chunk_reader.h"
#include "chunk/path_utils.h"
#include "model/errc.h"
#include "sink/partition_session.h"
#include "sink/remote_store.h"
#include "sink/tests/mock_host_runtime.h"
#include "test_utils/memory_object_store.h"
#include "test_utils/tmp_dir.h"
#include "utils/file_io.h"

#include <seastar/core/seastar.hh>

#include <fmt/format.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <filesystem>

using namespace std::chrono_literals;
using ::testing::_;
using ::testing::InSequence;
using ::testing::NiceMock;

namespace {

const model::partition_key pk{model::stream_name("payments"), model::partition_id(7)};
const object_store::bucket_name bucket{"archive"};

std::vector<model::record> make_records(int64_t first, size_t n) {
    std::vector<model::record> out;
    for (size_t i = 0; i < n; ++i) {
        out.push_back(model::record{
          .key = ss::sstring(fmt::format("k{}", first + i)),
          .value = ss::sstring(fmt::format("v{}", first + i))});
    }
    return out;
}

class PartitionSessionTest : public ::testing::Test {
public:
    std::unique_ptr<sink::partition_session> make_session() {
        return std::make_unique<sink::partition_session>(
          pk,
          chunk::writer_options{
            .buffer_dir = dir.get_path(), .segment_threshold = 256},
          codec,
          remote,
          host,
          "test-task");
    }

    std::unique_ptr<sink::partition_session> recovered_session() {
        auto s = make_session();
        auto ec = s->recover().get();
        if (ec) {
            ADD_FAILURE() << "recover failed: " << ec.message();
        }
        return s;
    }

    model::offset resume() {
        auto r = remote.resolve_resume_offset(pk).get();
        if (r.has_error()) {
            ADD_FAILURE() << "resolve failed: " << r.error().message();
            return model::offset(-1);
        }
        return r.value();
    }

    std::vector<model::record> read_back(model::offset chunk_start) {
        chunk::chunk_reader reader(
          store,
          chunk::reader_config{.bucket = bucket, .prefix = "", .timeout = 1s},
          codec);
        auto r = reader.read(pk, chunk_start, chunk_start, 1000).get();
        if (r.has_error()) {
            ADD_FAILURE() << "read failed: " << r.error().message();
            return {};
        }
        return std::move(r.value());
    }

    temporary_dir dir;
    memory_object_store store;
    chunk::binary_record_format format;
    chunk::chunk_codec codec{format};
    sink::remote_store remote{store, bucket, "", 1s};
    NiceMock<mock_host_runtime> host;
};

} // namespace

TEST_F(PartitionSessionTest, RecoveryPausesResetsAndResumes) {
    {
        InSequence seq;
        EXPECT_CALL(host, pause_delivery(pk));
        EXPECT_CALL(host, reset_delivery_cursor(pk, model::offset(0)));
        EXPECT_CALL(host, resume_delivery(pk));
    }
    auto s = make_session();
    EXPECT_EQ(s->state(), sink::session_state::recovering);
    EXPECT_FALSE(s->recover().get());
    EXPECT_EQ(s->state(), sink::session_state::active);
    EXPECT_EQ(s->next_offset(), model::offset(0));
    EXPECT_FALSE(s->close().get());
}

TEST_F(PartitionSessionTest, FailedRecoveryKeepsDeliveryPaused) {
    EXPECT_CALL(host, pause_delivery(pk));
    EXPECT_CALL(host, reset_delivery_cursor(_, _)).Times(0);
    EXPECT_CALL(host, resume_delivery(_)).Times(0);

    store.fail_next(memory_object_store::op::list, object_store::error_outcome::retry);
    auto s = make_session();
    auto ec = s->recover().get();
    EXPECT_EQ(ec, model::errc::remote_io_error);
    EXPECT_TRUE(model::is_retriable(ec));
    EXPECT_EQ(s->state(), sink::session_state::recovering);
    EXPECT_EQ(s->accept_batch(make_records(0, 1)).get(), model::errc::protocol_violation);

    ::testing::Mock::VerifyAndClearExpectations(&host);
    EXPECT_CALL(host, reset_delivery_cursor(pk, model::offset(0)));
    EXPECT_CALL(host, resume_delivery(pk));
    EXPECT_FALSE(s->recover().get());
    EXPECT_EQ(s->state(), sink::session_state::active);
    EXPECT_FALSE(s->close().get());
}

TEST_F(PartitionSessionTest, FlushCommitsContiguousChunks) {
    auto s = recovered_session();
    auto first = make_records(0, 3);
    EXPECT_FALSE(s->accept_batch(first).get());
    EXPECT_EQ(s->buffered_records(), 3);
    EXPECT_EQ(s->next_offset(), model::offset(3));

    EXPECT_FALSE(s->flush().get());
    EXPECT_EQ(s->state(), sink::session_state::active);
    EXPECT_EQ(s->buffered_records(), 0);
    EXPECT_EQ(s->next_offset(), model::offset(3));
    EXPECT_EQ(resume(), model::offset(3));
    EXPECT_EQ(read_back(model::offset(0)), first);

    // nothing buffered, nothing uploaded
    auto uploads = store.put_log().size();
    EXPECT_FALSE(s->flush().get());
    EXPECT_EQ(store.put_log().size(), uploads);

    auto second = make_records(3, 40);
    EXPECT_FALSE(s->accept_batch(second).get());
    EXPECT_FALSE(s->flush().get());
    EXPECT_EQ(resume(), model::offset(43));
    EXPECT_EQ(read_back(model::offset(3)), second);

    // committed chunks don't stay in the buffer directory
    EXPECT_FALSE(ss::file_exists(
                   (dir.get_path()
                    / std::string_view(
                      chunk::local_data_file_name(pk, model::offset(0))))
                     .native())
                   .get());
    EXPECT_FALSE(s->close().get());
}

TEST_F(PartitionSessionTest, FailedCommitKeepsSealedChunk) {
    auto s = recovered_session();
    auto records = make_records(0, 5);
    EXPECT_FALSE(s->accept_batch(records).get());

    store.fail_next(memory_object_store::op::put, object_store::error_outcome::retry);
    auto ec = s->flush().get();
    EXPECT_EQ(ec, model::errc::remote_io_error);
    EXPECT_TRUE(s->has_pending_commit());
    EXPECT_EQ(s->state(), sink::session_state::active);
    EXPECT_EQ(resume(), model::offset(0));

    // new records would change the sealed chunk
    EXPECT_EQ(
      s->accept_batch(make_records(5, 1)).get(), model::errc::commit_pending);

    EXPECT_FALSE(s->flush().get());
    EXPECT_FALSE(s->has_pending_commit());
    EXPECT_EQ(s->next_offset(), model::offset(5));
    EXPECT_EQ(resume(), model::offset(5));
    EXPECT_EQ(read_back(model::offset(0)), records);

    EXPECT_FALSE(s->accept_batch(make_records(5, 1)).get());
    EXPECT_EQ(s->next_offset(), model::offset(6));
    EXPECT_FALSE(s->close().get());
}

TEST_F(PartitionSessionTest, MalformedBatchIsRejected) {
    chunk::text_record_format text(false, "\t", "\n");
    chunk::chunk_codec text_codec(text);
    sink::partition_session s(
      pk,
      chunk::writer_options{.buffer_dir = dir.get_path()},
      text_codec,
      remote,
      host,
      "test-task");
    EXPECT_FALSE(s.recover().get());

    std::vector<model::record> batch{
      model::record{.key = std::nullopt, .value = "fine"},
      model::record{.key = std::nullopt, .value = "broken\nline"}};
    EXPECT_EQ(s.accept_batch(batch).get(), model::errc::serialization_error);
    EXPECT_EQ(s.buffered_records(), 0);
    EXPECT_EQ(s.state(), sink::session_state::active);

    batch.pop_back();
    EXPECT_FALSE(s.accept_batch(batch).get());
    EXPECT_EQ(s.buffered_records(), 1);
    EXPECT_FALSE(s.close().get());
}

TEST_F(PartitionSessionTest, FailedFinalizeClosesSession) {
    auto s = recovered_session();
    EXPECT_FALSE(s->accept_batch(make_records(0, 3)).get());

    auto data_path = dir.get_path()
                     / std::string_view(
                       chunk::local_data_file_name(pk, model::offset(0)));
    auto index_path = dir.get_path()
                      / std::string_view(
                        chunk::local_index_file_name(pk, model::offset(0)));
    // the index can't be written over a directory
    ASSERT_TRUE(std::filesystem::create_directory(index_path));

    EXPECT_EQ(s->flush().get(), model::errc::local_io_error);
    EXPECT_EQ(s->state(), sink::session_state::closed);
    EXPECT_FALSE(s->has_pending_commit());
    EXPECT_EQ(s->buffered_records(), 0);
    EXPECT_FALSE(ss::file_exists(data_path.native()).get());
    EXPECT_EQ(
      s->accept_batch(make_records(3, 1)).get(),
      model::errc::protocol_violation);
    EXPECT_EQ(s->flush().get(), model::errc::protocol_violation);
    EXPECT_TRUE(store.put_log().empty());

    // the records are delivered again from the last committed offset
    std::filesystem::remove(index_path);
    EXPECT_CALL(host, reset_delivery_cursor(pk, model::offset(0)));
    auto restarted = recovered_session();
    auto redelivered = make_records(0, 3);
    EXPECT_FALSE(restarted->accept_batch(redelivered).get());
    EXPECT_FALSE(restarted->flush().get());
    EXPECT_EQ(resume(), model::offset(3));
    EXPECT_EQ(read_back(model::offset(0)), redelivered);
    EXPECT_FALSE(restarted->close().get());
}

TEST_F(PartitionSessionTest, RestartResumesAfterCommittedChunks) {
    auto s = recovered_session();
    EXPECT_FALSE(s->accept_batch(make_records(0, 10)).get());
    EXPECT_FALSE(s->flush().get());
    // buffered but never committed
    EXPECT_FALSE(s->accept_batch(make_records(10, 4)).get());
    EXPECT_FALSE(s->close().get());

    // file a crashed process left behind
    auto stale = dir.get_path()
                 / std::string_view(
                   chunk::local_index_file_name(pk, model::offset(3)));
    write_fully(stale, ss::temporary_buffer<char>("stale", 5)).get();

    EXPECT_CALL(host, reset_delivery_cursor(pk, model::offset(10)));
    auto restarted = recovered_session();
    EXPECT_EQ(restarted->next_offset(), model::offset(10));
    EXPECT_EQ(restarted->buffered_records(), 0);
    EXPECT_FALSE(ss::file_exists(stale.native()).get());

    auto redelivered = make_records(10, 4);
    EXPECT_FALSE(restarted->accept_batch(redelivered).get());
    EXPECT_FALSE(restarted->flush().get());
    EXPECT_EQ(resume(), model::offset(14));
    EXPECT_EQ(read_back(model::offset(10)), redelivered);
    EXPECT_FALSE(restarted->close().get());
}

TEST_F(PartitionSessionTest, ClosedSessionRejectsCalls) {
    auto s = recovered_session();
    EXPECT_FALSE(s->accept_batch(make_records(0, 2)).get());
    EXPECT_FALSE(s->close().get());
    EXPECT_EQ(s->state(), sink::session_state::closed);
    EXPECT_EQ(s->buffered_records(), 0);

    EXPECT_EQ(
      s->accept_batch(make_records(2, 1)).get(),
      model::errc::protocol_violation);
    EXPECT_EQ(s->flush().get(), model::errc::protocol_violation);
    EXPECT_EQ(s->close().get(), model::errc::protocol_violation);
    EXPECT_EQ(s->recover().get(), model::errc::protocol_violation);
    // nothing was committed
    EXPECT_TRUE(store.put_log().empty());
}
