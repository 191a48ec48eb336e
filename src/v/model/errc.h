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

#include <cstdint>
#include <ostream>
#include <system_error>

namespace model {

/// Error kinds shared by every chunkvault component. Whether a caller may
/// re-drive the failed operation is decided by is_retriable(), never by the
/// component that produced the error.
enum class errc : int16_t {
    success = 0,
    // Missing or invalid option; the task must not start.
    invalid_configuration,
    // A record can't be represented in the selected format.
    serialization_error,
    // Buffer file can't be created, written, read or deleted.
    local_io_error,
    // Append after finalize, or finalize twice.
    writer_finalized,
    // Object store request failed; the same call may be repeated.
    remote_io_error,
    // Object store request timed out; the same call may be repeated.
    remote_timeout,
    // A sealed chunk is still waiting to be committed.
    commit_pending,
    // Remote object is missing or inconsistent with its index.
    corrupted_chunk,
    // The host called the core in a way the lifecycle doesn't allow.
    protocol_violation,
};

struct errc_category final : public std::error_category {
    const char* name() const noexcept final { return "chunkvault::errc"; }

    std::string message(int c) const final {
        switch (static_cast<errc>(c)) {
        case errc::success:
            return "Success";
        case errc::invalid_configuration:
            return "Invalid configuration";
        case errc::serialization_error:
            return "Record can't be serialized";
        case errc::local_io_error:
            return "Local buffer file error";
        case errc::writer_finalized:
            return "Chunk writer is already finalized";
        case errc::remote_io_error:
            return "Object store request failed";
        case errc::remote_timeout:
            return "Object store request timed out";
        case errc::commit_pending:
            return "Sealed chunk is waiting for commit";
        case errc::corrupted_chunk:
            return "Remote chunk is corrupted or incomplete";
        case errc::protocol_violation:
            return "Lifecycle protocol violation";
        }
        return "chunkvault::errc::unknown";
    }
};

inline const std::error_category& error_category() noexcept {
    static errc_category e;
    return e;
}

inline std::error_code make_error_code(errc e) noexcept {
    return {static_cast<int>(e), error_category()};
}

/// True for errors that leave every piece of local state untouched so the
/// host may re-drive the same lifecycle call.
inline bool is_retriable(std::error_code ec) {
    if (ec.category() != error_category()) {
        return false;
    }
    switch (static_cast<errc>(ec.value())) {
    case errc::remote_io_error:
    case errc::remote_timeout:
    case errc::commit_pending:
        return true;
    default:
        return false;
    }
}

inline std::ostream& operator<<(std::ostream& o, errc e) {
    return o << make_error_code(e).message();
}

} // namespace model

namespace std {
template<>
struct is_error_code_enum<model::errc> : true_type {};
} // namespace std
