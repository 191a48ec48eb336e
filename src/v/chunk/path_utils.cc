// Copyright 2024 Redpanda Data, Inc.
//
// Use of this software is governed by the Business Source License
// included in the file licenses/BSL.md
//
// As of the Change Date specified in that file, in accordance with
// the Business Source License, use of this software will be governed
// by the Apache License, Version 2.0
#include "chunk/path_utils.h"

#include <fmt/format.h>

#include <algorithm>
#include <charconv>

namespace chunk {

namespace {
constexpr size_t offset_width = 20;
constexpr std::string_view data_ext = ".gz";
constexpr std::string_view index_ext = ".index";

bool all_digits(std::string_view s) {
    return std::all_of(
      s.begin(), s.end(), [](char c) { return c >= '0' && c <= '9'; });
}
} // namespace

ss::sstring
local_data_file_name(const model::partition_key& key, model::offset o) {
    return fmt::format(
      "{}-{:05}-{:020}{}", key.stream, key.partition(), o(), data_ext);
}

ss::sstring
local_index_file_name(const model::partition_key& key, model::offset o) {
    return fmt::format(
      "{}-{:05}-{:020}{}", key.stream, key.partition(), o(), index_ext);
}

bool is_local_chunk_file(
  std::string_view file_name, const model::partition_key& key) {
    auto prefix = fmt::format("{}-{:05}-", key.stream, key.partition());
    if (!file_name.starts_with(prefix)) {
        return false;
    }
    file_name.remove_prefix(prefix.size());
    if (file_name.ends_with(data_ext)) {
        file_name.remove_suffix(data_ext.size());
    } else if (file_name.ends_with(index_ext)) {
        file_name.remove_suffix(index_ext.size());
    } else {
        return false;
    }
    return file_name.size() == offset_width && all_digits(file_name);
}

ss::sstring normalize_prefix(std::string_view prefix) {
    while (prefix.starts_with('/')) {
        prefix.remove_prefix(1);
    }
    while (prefix.ends_with('/')) {
        prefix.remove_suffix(1);
    }
    return ss::sstring(prefix);
}

ss::sstring remote_partition_prefix(
  std::string_view prefix, const model::partition_key& key) {
    if (prefix.empty()) {
        return fmt::format("{}/{}/", key.stream, key.partition());
    }
    return fmt::format("{}/{}/{}/", prefix, key.stream, key.partition());
}

object_store::object_key remote_data_key(
  std::string_view prefix, const model::partition_key& key, model::offset o) {
    return object_store::object_key(
      fmt::format("{}{:020}", remote_partition_prefix(prefix, key), o()));
}

object_store::object_key remote_index_key(
  std::string_view prefix, const model::partition_key& key, model::offset o) {
    return object_store::object_key(fmt::format(
      "{}{:020}{}", remote_partition_prefix(prefix, key), o(), index_ext));
}

std::optional<remote_object_name>
parse_remote_object_name(std::string_view name) {
    if (auto pos = name.rfind('/'); pos != std::string_view::npos) {
        name.remove_prefix(pos + 1);
    }
    bool is_index = false;
    if (name.ends_with(index_ext)) {
        name.remove_suffix(index_ext.size());
        is_index = true;
    }
    if (name.size() != offset_width || !all_digits(name)) {
        return std::nullopt;
    }
    int64_t value = 0;
    auto [ptr, ec] = std::from_chars(name.data(), name.data() + name.size(), value);
    if (ec != std::errc{} || ptr != name.data() + name.size()) {
        // doesn't fit into int64
        return std::nullopt;
    }
    return remote_object_name{.start = model::offset(value), .is_index = is_index};
}

} // namespace chunk
