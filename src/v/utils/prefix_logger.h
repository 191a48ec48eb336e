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
#include <seastar/util/log.hh>

#include <fmt/format.h>

/// Logger facade that prepends a fixed context (usually a partition) to every
/// message written through it.
class prefix_logger {
public:
    prefix_logger(ss::logger& logger, ss::sstring prefix)
      : _logger(logger)
      , _prefix(std::move(prefix)) {}

    template<typename... Args>
    void log(ss::log_level lvl, fmt::string_view format, Args&&... args) const {
        if (_logger.is_enabled(lvl)) {
            _logger.log(
              lvl,
              "{} - {}",
              _prefix,
              fmt::vformat(format, fmt::make_format_args(args...)));
        }
    }

    template<typename... Args>
    void error(fmt::string_view format, Args&&... args) const {
        log(ss::log_level::error, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warn(fmt::string_view format, Args&&... args) const {
        log(ss::log_level::warn, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info(fmt::string_view format, Args&&... args) const {
        log(ss::log_level::info, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void debug(fmt::string_view format, Args&&... args) const {
        log(ss::log_level::debug, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void trace(fmt::string_view format, Args&&... args) const {
        log(ss::log_level::trace, format, std::forward<Args>(args)...);
    }

    const ss::sstring& prefix() const { return _prefix; }

private:
    ss::logger& _logger;
    ss::sstring _prefix;
};
