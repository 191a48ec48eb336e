/*
 * Copyright 2020 Redpanda Data, Inc.
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

#include <seastar/core/iostream.hh>
#include <seastar/core/temporary_buffer.hh>

#include <algorithm>
#include <memory>
#include <utility>

/// Data source serving a single in-memory buffer.
class memory_data_source final : public ss::data_source_impl {
public:
    using value_type = ss::temporary_buffer<char>;

    explicit memory_data_source(value_type buffer)
      : _buffer(std::move(buffer)) {}

    ss::future<value_type> skip(uint64_t n) final {
        _buffer.trim_front(std::min<uint64_t>(n, _buffer.size()));
        return get();
    }
    ss::future<value_type> get() final {
        return ss::make_ready_future<value_type>(std::exchange(_buffer, {}));
    }

private:
    value_type _buffer;
};

inline ss::input_stream<char>
make_memory_input_stream(ss::temporary_buffer<char> buffer) {
    return ss::input_stream<char>(ss::data_source(
      std::make_unique<memory_data_source>(std::move(buffer))));
}
