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
#include "chunk/remote_io.h"

#include "base/vlog.h"
#include "chunk/logger.h"

namespace chunk {

ss::future<result<chunk_index>> download_index(
  object_store::client& client,
  const object_store::bucket_name& bucket,
  const object_store::object_key& key,
  ss::lowres_clock::duration timeout) {
    auto buf = co_await remote_call(
      timeout, client.get_object(bucket, key, timeout, true));
    if (buf.has_error()) {
        vlog(
          chunk_log.warn,
          "Failed to download index {}: {}",
          key,
          buf.error().message());
        co_return buf.error();
    }
    auto idx = chunk_index::parse(buf.value().get(), buf.value().size());
    if (idx.has_error()) {
        vlog(chunk_log.warn, "Index {} can't be parsed", key);
    }
    co_return std::move(idx);
}

} // namespace chunk
