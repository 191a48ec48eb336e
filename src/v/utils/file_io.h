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

#include <seastar/core/seastar.hh>
#include <seastar/core/sstring.hh>
#include <seastar/core/temporary_buffer.hh>

#include <filesystem>

/// \brief Read an entire file into a ss::temporary_buffer
ss::future<ss::temporary_buffer<char>>
read_fully_tmpbuf(const std::filesystem::path&);

/// \brief Read an entire file into a ss:sstring
ss::future<ss::sstring> read_fully_to_string(const std::filesystem::path&);

/// \brief Write an entire buffer into the file at location 'path', replacing
/// its previous content
ss::future<>
write_fully(const std::filesystem::path&, ss::temporary_buffer<char> buf);

/// \brief Remove the file at 'path' if it exists
ss::future<> remove_if_exists(const std::filesystem::path&);
