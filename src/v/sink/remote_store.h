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
#include "chunk/block_writer.h"
#include "chunk/chunk_index.h"
#include "model/fundamental.h"
#include "object_store/client.h"

#include <seastar/core/future.hh>
#include <seastar/core/lowres_clock.hh>

#include <filesystem>
#include <optional>
#include <vector>

namespace sink {

/// Committed chunks of a partition in the object store.
///
/// A chunk with start offset S is stored as two objects:
///
///   <prefix>/<stream>/<partition>/<S:020>        gzip data
///   <prefix>/<stream>/<partition>/<S:020>.index  chunk_index
///
/// The data object is always uploaded first, so a crash between the two
/// uploads leaves a data object without index. Such partial chunks are
/// ignored when the resume offset is computed and overwritten by the next
/// commit at the same start offset.
class remote_store {
public:
    struct remote_chunk {
        model::offset start;
        std::optional<uint64_t> data_size;
        std::optional<uint64_t> index_size;

        bool is_complete() const {
            return data_size.has_value() && index_size.has_value();
        }
    };

    remote_store(
      object_store::client& client,
      object_store::bucket_name bucket,
      ss::sstring prefix,
      ss::lowres_clock::duration timeout);

    /// Upload a finalized chunk. Returns the offset following its last
    /// record. Repeating a commit of the same files is harmless.
    ss::future<result<model::offset>> commit(
      const chunk::chunk_files& files,
      const model::partition_key& key,
      model::offset start);

    /// Offset of the first record that isn't stored in a complete remote
    /// chunk of the partition, zero for a partition without chunks.
    ss::future<result<model::offset>>
    resolve_resume_offset(const model::partition_key& key);

    /// Complete and partial chunks of the partition ordered by start offset.
    ss::future<result<std::vector<remote_chunk>>>
    list_chunks(const model::partition_key& key);

    ss::future<result<chunk::chunk_index>>
    download_index(const model::partition_key& key, model::offset start);

    /// Delete the objects of partial chunks. Must not run while a task
    /// archives the partition, an in-progress commit looks the same. Returns
    /// the number of deleted objects.
    ss::future<result<size_t>>
    remove_partial_chunks(const model::partition_key& key);

    const object_store::bucket_name& bucket() const { return _bucket; }
    const ss::sstring& prefix() const { return _prefix; }

private:
    ss::future<std::error_code> upload_file(
      const std::filesystem::path& path,
      const object_store::object_key& key,
      uint64_t size);

    object_store::client& _client;
    object_store::bucket_name _bucket;
    ss::sstring _prefix;
    ss::lowres_clock::duration _timeout;
};

} // namespace sink
