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
#include "base/units.h"
#include "chunk/block_writer.h"
#include "chunk/chunk_reader.h"
#include "chunk/record_format.h"
#include "object_store/types.h"

#include <seastar/core/lowres_clock.hh>
#include <seastar/core/sstring.hh>

#include <fmt/ostream.h>

#include <chrono>
#include <filesystem>
#include <iosfwd>
#include <map>
#include <string_view>

namespace YAML {
class Node;
} // namespace YAML

namespace sink {

/// Validated task configuration.
struct configuration {
    using property_map = std::map<ss::sstring, ss::sstring>;

    ss::sstring name{"chunkvault"};
    object_store::bucket_name bucket;
    // without leading or trailing '/'
    ss::sstring prefix;
    std::filesystem::path buffer_dir;
    size_t compressed_block_size{64_MiB};
    std::chrono::milliseconds remote_timeout{30000};
    chunk::format_options format;

    /// Build from host supplied string options. Unknown keys are ignored.
    static result<configuration> from_properties(const property_map&);

    /// Build from the 'chunkvault' node of a YAML document.
    static result<configuration> read_yaml(std::string_view document);

    chunk::writer_options writer_options() const {
        return {
          .buffer_dir = buffer_dir, .segment_threshold = compressed_block_size};
    }

    chunk::reader_config reader_config() const {
        return {
          .bucket = bucket,
          .prefix = prefix,
          .timeout = std::chrono::duration_cast<ss::lowres_clock::duration>(
            remote_timeout)};
    }
};

std::ostream& operator<<(std::ostream&, const configuration&);

} // namespace sink

template<>
struct fmt::formatter<sink::configuration> : fmt::ostream_formatter {};
