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
#include "base/vlog.h"
#include "chunk/chunk_index.h"
#include "chunk/logger.h"
#include "model/errc.h"
#include "object_store/client.h"

#include <seastar/core/coroutine.hh>
#include <seastar/core/future.hh>
#include <seastar/core/lowres_clock.hh>
#include <seastar/core/shared_future.hh>
#include <seastar/core/timed_out_error.hh>
#include <seastar/core/with_timeout.hh>
#include <seastar/util/log.hh>

#include <chrono>
#include <exception>
#include <optional>

namespace chunk {

/// Translate an object store failure into a chunkvault error. A missing key
/// means the chunk is incomplete, everything else is a transport failure.
inline std::error_code to_error_code(object_store::error_outcome e) {
    switch (e) {
    case object_store::error_outcome::key_not_found:
        return model::errc::corrupted_chunk;
    case object_store::error_outcome::retry:
    case object_store::error_outcome::fail:
        return model::errc::remote_io_error;
    }
    return model::errc::remote_io_error;
}

/// Await an object store request and map its error onto model::errc.
///
/// The request gets 'timeout' and is expected to bound itself by it. A
/// request still running at the deadline is reported as remote_timeout once
/// it has finished: it borrows the caller's arguments, and a retry must not
/// overlap with the attempt it replaces.
template<typename T>
ss::future<result<T>> remote_call(
  ss::lowres_clock::duration timeout,
  ss::future<result<T, object_store::error_outcome>> f) {
    using request_result = result<T, object_store::error_outcome>;
    std::optional<request_result> r;
    std::exception_ptr ex;
    ss::shared_future<> done(
      std::move(f).then_wrapped([&r, &ex](ss::future<request_result> fut) {
          if (fut.failed()) {
              ex = fut.get_exception();
          } else {
              r.emplace(fut.get());
          }
      }));

    bool timed_out = false;
    try {
        co_await ss::with_timeout(
          ss::lowres_clock::now() + timeout, done.get_future());
    } catch (const ss::timed_out_error&) {
        timed_out = true;
    }
    if (timed_out) {
        vlog(
          chunk_log.warn,
          "Object store request exceeded its {}ms timeout",
          std::chrono::duration_cast<std::chrono::milliseconds>(timeout)
            .count());
        co_await done.get_future();
        co_return model::errc::remote_timeout;
    }
    if (ex) {
        vlog(chunk_log.warn, "Object store request failed: {}", ex);
        co_return model::errc::remote_io_error;
    }
    if (r->has_error()) {
        co_return to_error_code(r->error());
    }
    co_return std::move(r->value());
}

/// Download and parse the index object 'key'.
ss::future<result<chunk_index>> download_index(
  object_store::client& client,
  const object_store::bucket_name& bucket,
  const object_store::object_key& key,
  ss::lowres_clock::duration timeout);

} // namespace chunk
