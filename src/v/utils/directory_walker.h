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

#include <seastar/core/file.hh>
#include <seastar/core/future.hh>
#include <seastar/core/sstring.hh>

#include <filesystem>
#include <functional>
#include <vector>

/// \brief map over all entries of a directory
///
/// return directory_walker::walk(dir, [](ss::directory_entry de) {
///   return visit(std::move(de));
/// });
struct directory_walker {
    using walker_type = std::function<ss::future<>(ss::directory_entry)>;

    static ss::future<> walk(std::string_view dirname, walker_type walker_func);

    /// Every regular file below 'root', as paths relative to 'root'.
    /// A missing 'root' yields an empty list.
    static ss::future<std::vector<std::filesystem::path>>
    list_files_recursive(std::filesystem::path root);
};
