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

#include <seastar/core/sstring.hh>

#include <gtest/gtest.h>

// Turns fatal assertion failures into exceptions so that an ASSERT_* inside a
// helper function or a seastar thread unwinds the whole test body.
class chunkvault_test_listener : public ::testing::EmptyTestEventListener {
    void
    OnTestIterationStart(const ::testing::UnitTest&, int iteration) override;

    void OnTestPartResult(const ::testing::TestPartResult& result) override;
};

// Name of a directory unique to the running test case and iteration, e.g.
//
// BlockWriterTest.SealsSegmentsAtThreshold.6125307633855650.0
//
// Callers create the directory.
ss::sstring get_test_directory();
