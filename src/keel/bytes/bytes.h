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

#include <cstdint>
#include <string_view>

// Opaque payload bytes. Short payloads are stored inline.
using bytes = ss::basic_sstring<uint8_t, uint32_t, 31, false>;
using bytes_view = std::basic_string_view<uint8_t>;

inline bytes bytes_from_string(std::string_view s) {
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    return {reinterpret_cast<const uint8_t*>(s.data()), s.size()};
}
