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
#include "utils/named_type.h"

#include <seastar/core/sstring.hh>

#include <fmt/ostream.h>

#include <system_error>

namespace object_store {

using bucket_name = named_type<ss::sstring, struct object_store_bucket_name>;
using object_key = named_type<ss::sstring, struct object_store_object_key>;

enum class error_outcome {
    retry,
    /// Error condition that couldn't be retried
    fail,
    /// Missing key API error (only suitable for downloads and deletions)
    key_not_found,
};

struct error_outcome_category final : public std::error_category {
    const char* name() const noexcept final {
        return "object_store::error_outcome";
    }

    std::string message(int c) const final {
        switch (static_cast<error_outcome>(c)) {
        case error_outcome::retry:
            return "Retryable error";
        case error_outcome::fail:
            return "Non retriable error";
        case error_outcome::key_not_found:
            return "Key not found error";
        default:
            return "Undefined error_outcome encountered";
        }
    }
};

inline const std::error_category& error_category() noexcept {
    static error_outcome_category e;
    return e;
}

inline std::error_code make_error_code(error_outcome e) noexcept {
    return {static_cast<int>(e), error_category()};
}

std::ostream& operator<<(std::ostream& o, error_outcome e);

} // namespace object_store

template<>
struct fmt::formatter<object_store::error_outcome> : fmt::ostream_formatter {};

namespace std {
template<>
struct is_error_code_enum<object_store::error_outcome> : true_type {};
} // namespace std
