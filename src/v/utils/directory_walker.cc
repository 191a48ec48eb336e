// Copyright 2024 Redpanda Data, Inc.
//
// Use of this software is governed by the Business Source License
// included in the file licenses/BSL.md
//
// As of the Change Date specified in that file, in accordance with
// the Business Source License, use of this software will be governed
// by the Apache License, Version 2.0
#include "utils/directory_walker.h"

#include <seastar/core/coroutine.hh>
#include <seastar/core/seastar.hh>

#include <deque>

ss::future<>
directory_walker::walk(std::string_view dirname, walker_type walker_func) {
    return ss::open_directory(dirname).then(
      [walker_func = std::move(walker_func)](ss::file f) mutable {
          auto s = f.list_directory(std::move(walker_func));
          return s.done().finally(
            [f = std::move(f)]() mutable { return f.close().finally([f] {}); });
      });
}

ss::future<std::vector<std::filesystem::path>>
directory_walker::list_files_recursive(std::filesystem::path root) {
    std::vector<std::filesystem::path> files;
    if (!co_await ss::file_exists(root.native())) {
        co_return files;
    }
    std::deque<std::filesystem::path> pending{std::filesystem::path{}};
    while (!pending.empty()) {
        auto rel = std::move(pending.front());
        pending.pop_front();
        co_await walk(
          (root / rel).native(),
          [&files, &pending, &rel](ss::directory_entry de) {
              auto child = rel / de.name.c_str();
              if (de.type == ss::directory_entry_type::directory) {
                  pending.push_back(std::move(child));
              } else if (de.type == ss::directory_entry_type::regular) {
                  files.push_back(std::move(child));
              }
              return ss::now();
          });
    }
    co_return files;
}
