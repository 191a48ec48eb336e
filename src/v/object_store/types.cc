// Copyright 2024 Redpanda Data, Inc.
//
// Use of this software is governed by the Business Source License
// included in the file licenses/BSL.md
//
// As of the Change Date specified in that file, in accordance with
// the Business Source License, use of this software will be governed
// by the Apache License, Version 2.0

#include "object_store/types.h"

#include <ostream>

namespace object_store {

std::ostream& operator<<(std::ostream& o, error_outcome e) {
    switch (e) {
    case error_outcome::retry:
        o << "{retry}";
        break;
    case error_outcome::fail:
        o << "{fail}";
        break;
    case error_outcome::key_not_found:
        o << "{key_not_found}";
        break;
    }
    return o;
}

} // namespace object_store
