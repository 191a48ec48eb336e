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

#include "base/seastarx.h"
#include "utils/named_type.h"

#include <seastar/core/sstring.hh>

#include <fmt/core.h>

#include <cstdint>
#include <optional>
#include <ostream>
#include <vector>

namespace model {

/// Name of the record stream a partition belongs to (a topic).
using stream_name = named_type<ss::sstring, struct stream_name_type>;

using partition_id = named_type<int32_t, struct partition_id_type>;

/// Position of a record inside its partition. Committed offsets of a
/// partition are contiguous and start at zero.
using offset = named_type<int64_t, struct offset_type>;

/// Identity of one ordered record sequence.
struct partition_key {
    partition_key() = default;
    partition_key(stream_name s, partition_id p)
      : stream(std::move(s))
      , partition(p) {}

    stream_name stream;
    partition_id partition{0};

    bool operator==(const partition_key& other) const {
        return partition == other.partition && stream == other.stream;
    }

    bool operator<(const partition_key& other) const {
        return stream < other.stream
               || (stream == other.stream && partition < other.partition);
    }

    template<typename H>
    friend H AbslHashValue(H h, const partition_key& k) {
        return H::combine(std::move(h), k.stream, k.partition);
    }

    friend std::ostream& operator<<(std::ostream& o, const partition_key& k) {
        return o << k.stream() << "/" << k.partition();
    }
};

/// A single record as delivered by the host. Absent key and absent value
/// are distinct from empty ones.
struct record {
    std::optional<ss::sstring> key;
    std::optional<ss::sstring> value;

    bool operator==(const record&) const = default;
};

using record_batch = std::vector<record>;

} // namespace model

template<>
struct fmt::formatter<model::partition_key>
  : fmt::formatter<std::string_view> {
    template<typename FormatContext>
    auto format(const model::partition_key& k, FormatContext& ctx) const {
        return fmt::format_to(
          ctx.out(), "{}/{}", std::string_view(k.stream()), k.partition());
    }
};

namespace std {
template<>
struct hash<model::partition_key> {
    size_t operator()(const model::partition_key& k) const {
        size_t h = std::hash<ss::sstring>()(k.stream());
        return h ^ (std::hash<int32_t>()(k.partition()) << 1U);
    }
};
} // namespace std
