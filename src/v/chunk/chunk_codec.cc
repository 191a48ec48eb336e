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
#include "chunk/chunk_codec.h"

#include "base/vlog.h"
#include "chunk/logger.h"

namespace chunk {

size_t encoded_batch::size_bytes() const {
    size_t total = 0;
    for (const auto& f : frames) {
        total += f.size();
    }
    return total;
}

codec_state
chunk_codec::open(const model::partition_key& key, model::offset start) const {
    return codec_state{
      .key = key,
      .start = start,
      .record_count = 0,
      .header = _format.encode_header(key, start)};
}

result<encoded_batch> chunk_codec::encode(
  codec_state& state, std::span<const model::record> batch) const {
    encoded_batch out;
    out.frames.reserve(batch.size());
    for (size_t i = 0; i < batch.size(); ++i) {
        auto frame = _format.encode_record(batch[i]);
        if (frame.has_error()) {
            vlog(
              chunk_log.error,
              "{} - rejecting batch of {} records, record at offset {} can't "
              "be encoded as {}: {}",
              state.key,
              batch.size(),
              state.start() + state.record_count + static_cast<int64_t>(i),
              _format.name(),
              frame.error().message());
            return frame.error();
        }
        out.frames.push_back(std::move(frame.value()));
    }
    state.record_count += static_cast<int64_t>(batch.size());
    return out;
}

ss::temporary_buffer<char> chunk_codec::close(const codec_state& state) const {
    return _format.encode_trailer(state.record_count);
}

} // namespace chunk
