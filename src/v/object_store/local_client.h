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

#include "object_store/client.h"

#include <seastar/core/gate.hh>

#include <filesystem>

namespace object_store {

/// Object store backed by a local (or network mounted) directory.
///
/// Bucket 'b' is the directory '<root>/b' and object 'k' is the file
/// '<root>/b/k'. Uploads are written to a temporary file next to the target
/// and renamed over it, which makes every put atomic. Timeouts are ignored.
class local_client final : public client {
public:
    explicit local_client(std::filesystem::path root);

    ss::future<> stop() override;

    ss::future<result<ss::temporary_buffer<char>, error_outcome>> get_object(
      const bucket_name& name,
      const object_key& key,
      ss::lowres_clock::duration timeout,
      bool expect_no_such_key = false,
      std::optional<byte_range> range = std::nullopt) override;

    ss::future<result<head_object_result, error_outcome>> head_object(
      const bucket_name& name,
      const object_key& key,
      ss::lowres_clock::duration timeout) override;

    ss::future<result<no_response, error_outcome>> put_object(
      const bucket_name& name,
      const object_key& key,
      size_t payload_size,
      ss::input_stream<char> body,
      ss::lowres_clock::duration timeout) override;

    ss::future<result<list_bucket_result, error_outcome>> list_objects(
      const bucket_name& name,
      std::optional<object_key> prefix,
      std::optional<size_t> max_keys,
      std::optional<ss::sstring> continuation_token,
      ss::lowres_clock::duration timeout) override;

    ss::future<result<no_response, error_outcome>> delete_object(
      const bucket_name& name,
      const object_key& key,
      ss::lowres_clock::duration timeout) override;

    /// Suffix of in-flight uploads; such files are never listed.
    static constexpr std::string_view partial_suffix = ".partial";

private:
    std::filesystem::path object_path(
      const bucket_name& name, const object_key& key) const;

    std::filesystem::path _root;
    ss::gate _gate;
};

} // namespace object_store
