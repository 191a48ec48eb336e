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
#include "test_utils/gtest_utils.h"

#include <seastar/core/lowres_clock.hh>

#include <fmt/format.h>
#include <gtest/gtest.h>

#include <algorithm>
#include <stdexcept>

namespace {
int gtest_iteration = 0;
} // anonymous namespace

void chunkvault_test_listener::OnTestIterationStart(
  const ::testing::UnitTest& /*unit_test*/, int iteration) {
    gtest_iteration = iteration;
}

void chunkvault_test_listener::OnTestPartResult(
  const ::testing::TestPartResult& result) {
    if (result.type() == testing::TestPartResult::kFatalFailure) {
        throw testing::AssertionException(result);
    }
}

ss::sstring get_test_directory() {
    const auto* test_info
      = ::testing::UnitTest::GetInstance()->current_test_info();
    if (test_info == nullptr) {
        throw std::logic_error("get_test_directory() called outside a test");
    }

    // The timestamp separates test processes, the iteration separates
    // --gtest_repeat runs.
    static auto now = ss::lowres_clock::now();
    ss::sstring dir = fmt::format(
      "{}.{}.{}.{}",
      test_info->test_suite_name(),
      test_info->name(),
      now.time_since_epoch().count(),
      gtest_iteration);

    // parameterized test names contain '/'
    std::replace(dir.begin(), dir.end(), '/', '_');
    return dir;
}
