/*
 * Copyright 2023 Redpanda Data, Inc.
 *
 * Use of this software is governed by the Business Source License
 * included in the file licenses/BSL.md
 *
 * As of the Change Date specified in that file, in accordance with
 * the Business Source License, use of this software will be governed
 * by the Apache License, Version 2.0
 */
#include "test_utils/gtest_utils.h"

#include <seastar/core/thread.hh>
#include <seastar/testing/test_runner.hh>

#include <gtest/gtest.h>

// Runs every test case inside a seastar thread on shard 0, so test bodies may
// block on futures with .get().
int main(int argc, char** argv) {
    testing::InitGoogleTest(&argc, argv);

    auto& listeners = ::testing::UnitTest::GetInstance()->listeners();
    listeners.Append(new chunkvault_test_listener());

    // Listing must not start seastar: gtest_discover_tests queries every
    // executable in parallel and seastar would exhaust aio-max-nr.
    if (GTEST_FLAG_GET(list_tests)) {
        return RUN_ALL_TESTS();
    }

    seastar::testing::global_test_runner().start(argc, argv);

    int ret = 0;
    seastar::testing::global_test_runner().run_sync(
      [&ret] { return seastar::async([&ret] { ret = RUN_ALL_TESTS(); }); });

    int ss_ret = seastar::testing::global_test_runner().finalize();
    if (ret) {
        return ret;
    }
    return ss_ret;
}
