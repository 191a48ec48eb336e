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

#include "object_store/local_client.h"

#include "base/vlog.h"
#include "object_store/logger.h"
#include "utils/directory_walker.h"

#include <seastar/core/coroutine.hh>
#include <seastar/core/file.hh>
#include <seastar/core/fstream.hh>
#include <seastar/core/seastar.hh>

#include <algorithm>
#include <exception>

namespace object_store {

local_client::local_client(std::filesystem::path root)
  : _root(std::move(root)) {}

ss::future<> local_client::stop() { return _gate.close(); }

std::filesystem::path local_client::object_path(
  const bucket_name& name, const object_key& key) const {
    return _root / std::string_view(name()) / std::string_view(key());
}

ss::future<result<ss::temporary_buffer<char>, error_outcome>>
local_client::get_object(
  const bucket_name& name,
  const object_key& key,
  ss::lowres_clock::duration,
  bool expect_no_such_key,
  std::optional<byte_range> range) {
    auto holder = _gate.hold();
    auto path = object_path(name, key);
    try {
        if (!co_await ss::file_exists(path.native())) {
            if (expect_no_such_key) {
                vlog(client_log.debug, "Object {} not found", key);
            } else {
                vlog(client_log.warn, "Object {} not found", key);
            }
            co_return error_outcome::key_not_found;
        }
        uint64_t size = co_await ss::file_size(path.native());
        uint64_t first = 0;
        uint64_t len = size;
        if (range.has_value()) {
            if (range->first > range->second || range->first >= size) {
                vlog(
                  client_log.warn,
                  "Byte range [{}, {}] is outside of object {} of size {}",
                  range->first,
                  range->second,
                  key,
                  size);
                co_return error_outcome::fail;
            }
            first = range->first;
            len = std::min(range->second, size - 1) - first + 1;
        }
        if (len == 0) {
            co_return ss::temporary_buffer<char>{};
        }
        auto buf = co_await ss::with_file(
          ss::open_file_dma(path.native(), ss::open_flags::ro),
          [first, len](ss::file& f) {
              return f.dma_read_bulk<char>(first, len);
          });
        co_return std::move(buf);
    } catch (...) {
        vlog(
          client_log.error,
          "Failed to read object {} from {}: {}",
          key,
          path.native(),
          std::current_exception());
    }
    co_return error_outcome::fail;
}

ss::future<result<client::head_object_result, error_outcome>>
local_client::head_object(
  const bucket_name& name,
  const object_key& key,
  ss::lowres_clock::duration) {
    auto holder = _gate.hold();
    auto path = object_path(name, key);
    try {
        if (!co_await ss::file_exists(path.native())) {
            co_return error_outcome::key_not_found;
        }
        auto size = co_await ss::file_size(path.native());
        co_return head_object_result{.object_size = size};
    } catch (...) {
        vlog(
          client_log.error,
          "Failed to stat object {}: {}",
          key,
          std::current_exception());
    }
    co_return error_outcome::fail;
}

ss::future<result<client::no_response, error_outcome>>
local_client::put_object(
  const bucket_name& name,
  const object_key& key,
  size_t payload_size,
  ss::input_stream<char> body,
  ss::lowres_clock::duration) {
    auto holder = _gate.hold();
    auto path = object_path(name, key);
    auto tmp = path;
    tmp += partial_suffix;

    bool uploaded = false;
    try {
        co_await ss::recursive_touch_directory(path.parent_path().native());
        auto flags = ss::open_flags::wo | ss::open_flags::create
                     | ss::open_flags::truncate;
        auto f = co_await ss::open_file_dma(tmp.native(), flags);
        auto out = co_await ss::make_file_output_stream(std::move(f));
        std::exception_ptr ex;
        size_t written = 0;
        try {
            while (true) {
                auto buf = co_await body.read();
                if (buf.empty()) {
                    break;
                }
                written += buf.size();
                co_await out.write(std::move(buf));
            }
            co_await out.flush();
        } catch (...) {
            ex = std::current_exception();
        }
        co_await out.close();
        co_await body.close();
        if (ex) {
            std::rethrow_exception(ex);
        }
        if (written != payload_size) {
            vlog(
              client_log.error,
              "Object {} body size {} doesn't match payload size {}",
              key,
              written,
              payload_size);
        } else {
            co_await ss::rename_file(tmp.native(), path.native());
            co_await ss::sync_directory(path.parent_path().native());
            uploaded = true;
        }
    } catch (...) {
        vlog(
          client_log.error,
          "Failed to upload object {} to {}: {}",
          key,
          path.native(),
          std::current_exception());
    }

    if (!uploaded) {
        try {
            if (co_await ss::file_exists(tmp.native())) {
                co_await ss::remove_file(tmp.native());
            }
        } catch (...) {
            vlog(
              client_log.warn,
              "Failed to remove partial upload {}: {}",
              tmp.native(),
              std::current_exception());
        }
        co_return error_outcome::retry;
    }
    vlog(client_log.trace, "Uploaded object {}, {} bytes", key, payload_size);
    co_return no_response{};
}

ss::future<result<client::list_bucket_result, error_outcome>>
local_client::list_objects(
  const bucket_name& name,
  std::optional<object_key> prefix,
  std::optional<size_t> max_keys,
  std::optional<ss::sstring> continuation_token,
  ss::lowres_clock::duration) {
    auto holder = _gate.hold();
    list_bucket_result res;
    std::string_view prefix_view;
    if (prefix.has_value()) {
        res.prefix = (*prefix)();
        prefix_view = std::string_view((*prefix)());
    }
    // Only the directory the prefix points into has to be walked.
    std::string dir_part;
    if (auto pos = prefix_view.rfind('/'); pos != std::string_view::npos) {
        dir_part = std::string(prefix_view.substr(0, pos));
    }
    auto bucket_root = _root / std::string_view(name());
    try {
        auto files = co_await directory_walker::list_files_recursive(
          bucket_root / dir_part);
        std::vector<std::string> keys;
        keys.reserve(files.size());
        for (const auto& f : files) {
            auto k = dir_part.empty()
                       ? f.generic_string()
                       : (std::filesystem::path(dir_part) / f).generic_string();
            if (k.ends_with(partial_suffix) || !k.starts_with(prefix_view)) {
                continue;
            }
            if (
              continuation_token.has_value()
              && std::string_view(k)
                   <= std::string_view(continuation_token.value())) {
                continue;
            }
            keys.push_back(std::move(k));
        }
        std::sort(keys.begin(), keys.end());
        for (const auto& k : keys) {
            if (max_keys.has_value() && res.contents.size() == *max_keys) {
                res.is_truncated = true;
                res.next_continuation_token = res.contents.back().key;
                break;
            }
            auto size = co_await ss::file_size((bucket_root / k).native());
            res.contents.push_back(
              list_bucket_item{.key = ss::sstring(k), .size_bytes = size});
        }
    } catch (...) {
        vlog(
          client_log.error,
          "Failed to list bucket {} with prefix '{}': {}",
          name,
          res.prefix,
          std::current_exception());
        co_return error_outcome::retry;
    }
    co_return std::move(res);
}

ss::future<result<client::no_response, error_outcome>>
local_client::delete_object(
  const bucket_name& name,
  const object_key& key,
  ss::lowres_clock::duration) {
    auto holder = _gate.hold();
    auto path = object_path(name, key);
    try {
        if (co_await ss::file_exists(path.native())) {
            co_await ss::remove_file(path.native());
        }
        co_return no_response{};
    } catch (...) {
        vlog(
          client_log.error,
          "Failed to delete object {}: {}",
          key,
          std::current_exception());
    }
    co_return error_outcome::retry;
}

} // namespace object_store
