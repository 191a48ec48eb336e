// Copyright 2024 Redpanda Data, Inc.
//
// Use of this software is governed by the Business Source License
// included in the file licenses/BSL.md
//
// As of the Change Date specified in that file, in accordance with
// the Business Source License, use of this software will be governed
// by the Apache License, Version 2.0
#pragma once

#include "base/seastarx.h"
#include "model/fundamental.h"
#include "object_store/types.h"

#include <seastar/core/sstring.hh>

#include <optional>
#include <string_view>

namespace chunk {

// Local buffer files of a chunk:
// orders-00003-00000000000000001000.gz
// orders-00003-00000000000000001000.index
ss::sstring local_data_file_name(const model::partition_key&, model::offset);
ss::sstring local_index_file_name(const model::partition_key&, model::offset);

/// True if 'file_name' is a buffer file (data or index) of partition 'key'.
bool is_local_chunk_file(std::string_view file_name, const model::partition_key& key);

// Remote objects of a chunk:
// archive/orders/3/00000000000000001000
// archive/orders/3/00000000000000001000.index
// The zero padding keeps lexicographic and numeric order identical for every
// non-negative offset.
ss::sstring
remote_partition_prefix(std::string_view prefix, const model::partition_key&);
object_store::object_key remote_data_key(
  std::string_view prefix, const model::partition_key&, model::offset);
object_store::object_key remote_index_key(
  std::string_view prefix, const model::partition_key&, model::offset);

struct remote_object_name {
    model::offset start;
    bool is_index;
};

/// Parse the last path component of a remote chunk object. Returns nullopt
/// for names that weren't produced by remote_data_key/remote_index_key.
std::optional<remote_object_name> parse_remote_object_name(std::string_view);

/// Strip leading and trailing '/' characters.
ss::sstring normalize_prefix(std::string_view prefix);

} // namespace chunk
