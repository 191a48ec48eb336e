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

#include "sink/host_runtime.h"

#include <gmock/gmock.h>

class mock_host_runtime : public sink::host_runtime {
public:
    MOCK_METHOD(
      void, pause_delivery, (const model::partition_key&), (override));
    MOCK_METHOD(
      void, resume_delivery, (const model::partition_key&), (override));
    MOCK_METHOD(
      void,
      reset_delivery_cursor,
      (const model::partition_key&, model::offset),
      (override));
};
