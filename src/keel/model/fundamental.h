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

#include <cstdint>

namespace model {

/// Position of an entry within a topic's log. Default constructed offsets
/// hold the minimum value and mean "no offset yet".
using offset = named_type<int64_t, struct model_offset_type>;

/// Name of a keyed log.
using topic = named_type<ss::sstring, struct model_topic_type>;

/// Offset following `o`. The successor of the sentinel is offset 0.
inline constexpr offset next_offset(offset o) {
    if (o < offset{0}) {
        return offset{0};
    }
    return o + offset{1};
}

/// Offset preceding `o`, saturating at the sentinel.
inline constexpr offset prev_offset(offset o) {
    if (o <= offset{0}) {
        return offset{};
    }
    return o - offset{1};
}

} // namespace model
