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
#include "base/vlog.h"
#include "test_utils/gtest_utils.h"

#include <seastar/util/log.hh>
#include <seastar/util/tmp_file.hh>

#include <exception>
#include <filesystem>

namespace details {
inline ss::logger tmpdir_logger("tmpdir-log");
}

/// Scratch directory of a test case, removed with everything in it when the
/// object goes out of scope. Must be used from a seastar thread.
class temporary_dir {
public:
    temporary_dir()
      : temporary_dir(std::filesystem::temp_directory_path()) {}

    explicit temporary_dir(const std::filesystem::path& root) {
        auto path = root / fmt::format("{}-XXXX", get_test_directory());
        try {
            _dir = ss::make_tmp_dir(path.native()).get();
            vlog(
              details::tmpdir_logger.debug,
              "Created temporary directory {}",
              _dir.get_path().native());
        } catch (...) {
            vlog(
              details::tmpdir_logger.error,
              "Can't create temporary directory at {}, Error: {}",
              path.native(),
              std::current_exception());
            throw;
        }
    }
    temporary_dir(const temporary_dir&) = delete;
    temporary_dir& operator=(const temporary_dir&) = delete;
    temporary_dir(temporary_dir&&) = delete;
    temporary_dir& operator=(temporary_dir&&) = delete;
    ~temporary_dir() noexcept {
        try {
            if (_dir.has_path()) {
                _dir.remove().get();
            }
        } catch (...) {
            vlog(
              details::tmpdir_logger.error,
              "Can't remove temporary directory. Error: {}",
              std::current_exception());
        }
    }

    std::filesystem::path get_path() const { return _dir.get_path(); }

private:
    ss::tmp_dir _dir;
};
