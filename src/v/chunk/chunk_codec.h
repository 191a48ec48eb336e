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
#include "chunk/record_format.h"
#include "model/fundamental.h"

#include <seastar/core/temporary_buffer.hh>

#include <span>
#include <vector>

namespace chunk {

/// Per chunk serialization context created by chunk_codec::open.
struct codec_state {
    model::partition_key key;
    model::offset start;
    // Records encoded so far.
    int64_t record_count{0};
    // Header frame, the first bytes of the chunk.
    ss::temporary_buffer<char> header;
};

struct encoded_batch {
    // One frame per record, in input order.
    std::vector<ss::temporary_buffer<char>> frames;

    size_t size_bytes() const;
};

/// Turns record batches into the frames stored in a chunk using the
/// configured record_format.
class chunk_codec {
public:
    explicit chunk_codec(const record_format& format)
      : _format(format) {}

    codec_state open(const model::partition_key& key, model::offset start) const;

    /// Encode a whole batch. If any record can't be serialized nothing is
    /// returned and 'state' is left unchanged.
    result<encoded_batch>
    encode(codec_state& state, std::span<const model::record> batch) const;

    /// Trailer frame for the records encoded through 'state'.
    ss::temporary_buffer<char> close(const codec_state& state) const;

    result<std::vector<model::record>> decode(const char* data, size_t size) const {
        return _format.decode(data, size);
    }

    const record_format& format() const { return _format; }

private:
    const record_format& _format;
};

} // namespace chunk
