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
#include "object_store/types.h"

#include <seastar/core/future.hh>
#include <seastar/core/iostream.hh>
#include <seastar/core/lowres_clock.hh>
#include <seastar/core/temporary_buffer.hh>

#include <optional>
#include <vector>

namespace object_store {

/// Inclusive [first, last] byte positions, same as an HTTP Range header.
using byte_range = std::pair<uint64_t, uint64_t>;

/// Object store API used by the sink. Implementations must make every single
/// object upload atomic: a reader either sees the previous object or the new
/// one, never a prefix of it.
class client {
public:
    struct no_response {};

    client() = default;
    client(const client&) = delete;
    client& operator=(const client&) = delete;
    client(client&&) = delete;
    client& operator=(client&&) = delete;
    virtual ~client() = default;

    /// Stop the client
    virtual ss::future<> stop() = 0;

    /// Download object (or a byte range of it).
    ///
    /// \param name is a bucket name
    /// \param key is an object key
    /// \param timeout is a timeout of the operation
    /// \param expect_no_such_key log missing key events as debug if true
    /// \param range optional inclusive byte range
    virtual ss::future<result<ss::temporary_buffer<char>, error_outcome>>
    get_object(
      const bucket_name& name,
      const object_key& key,
      ss::lowres_clock::duration timeout,
      bool expect_no_such_key = false,
      std::optional<byte_range> range = std::nullopt)
      = 0;

    struct head_object_result {
        uint64_t object_size;
    };

    /// Get metadata for object from cloud storage.
    virtual ss::future<result<head_object_result, error_outcome>> head_object(
      const bucket_name& name,
      const object_key& key,
      ss::lowres_clock::duration timeout)
      = 0;

    /// Upload object. An existing object with the same key is replaced.
    ///
    /// \param name is a bucket name
    /// \param key is an id of the object
    /// \param payload_size is a size of the object in bytes
    /// \param body is an input_stream that can be used to read body
    /// \param timeout is a timeout of the operation
    virtual ss::future<result<no_response, error_outcome>> put_object(
      const bucket_name& name,
      const object_key& key,
      size_t payload_size,
      ss::input_stream<char> body,
      ss::lowres_clock::duration timeout)
      = 0;

    struct list_bucket_item {
        ss::sstring key;
        size_t size_bytes;
    };
    struct list_bucket_result {
        bool is_truncated = false;
        ss::sstring prefix;
        ss::sstring next_continuation_token;
        /// Sorted by key
        std::vector<list_bucket_item> contents;
    };

    /// List the objects in a bucket in lexicographic key order
    ///
    /// \param name is a bucket name
    /// \param prefix optional prefix of objects to list
    /// \param max_keys optional upper bound on the number of returned keys
    /// \param continuation_token token returned by a previous call
    /// \param timeout operation timeout
    virtual ss::future<result<list_bucket_result, error_outcome>> list_objects(
      const bucket_name& name,
      std::optional<object_key> prefix,
      std::optional<size_t> max_keys,
      std::optional<ss::sstring> continuation_token,
      ss::lowres_clock::duration timeout)
      = 0;

    /// Delete object. Deleting a missing key succeeds.
    virtual ss::future<result<no_response, error_outcome>> delete_object(
      const bucket_name& name,
      const object_key& key,
      ss::lowres_clock::duration timeout)
      = 0;
};

} // namespace object_store
