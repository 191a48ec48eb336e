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

#include "model/fundamental.h"

namespace sink {

/// Delivery controls offered by the runtime that feeds records to the sink.
class host_runtime {
public:
    host_runtime() = default;
    host_runtime(const host_runtime&) = delete;
    host_runtime& operator=(const host_runtime&) = delete;
    host_runtime(host_runtime&&) = delete;
    host_runtime& operator=(host_runtime&&) = delete;
    virtual ~host_runtime() = default;

    /// Stop delivering records of the partition until resume_delivery.
    virtual void pause_delivery(const model::partition_key&) = 0;
    virtual void resume_delivery(const model::partition_key&) = 0;
    /// Next record delivered for the partition will have offset 'o'.
    virtual void
    reset_delivery_cursor(const model::partition_key&, model::offset o)
      = 0;
};

} // namespace sink
