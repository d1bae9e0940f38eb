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
#include "bytes/bytes.h"
#include "model/fundamental.h"
#include "model/timestamp.h"

#include <seastar/core/sstring.hh>

#include <fmt/ostream.h>

#include <cstdint>
#include <iosfwd>
#include <optional>

namespace model {

/// A single keyed (or unkeyed) value appended to a topic. A present key with
/// an empty payload is a tombstone: a delete marker for that key.
struct entry {
    model::offset offset;
    std::optional<ss::sstring> key;
    bytes payload;
    model::timestamp timestamp;

    bool has_key() const { return key.has_value(); }
    bool is_tombstone() const { return has_key() && payload.empty(); }

    /// Payload as seen by consumers. Tombstones have no value, which is
    /// distinct from an unkeyed entry carrying an empty payload.
    std::optional<bytes_view> value() const {
        if (is_tombstone()) {
            return std::nullopt;
        }
        return bytes_view(payload);
    }

    /// Size of the user supplied data, key plus payload.
    size_t size_bytes() const {
        return payload.size() + (key ? key->size() : 0);
    }

    bool operator==(const entry&) const = default;

    friend std::ostream& operator<<(std::ostream&, const entry&);
};

/// Encodes `v` the way producers of int32 valued topics do: four bytes,
/// big endian.
bytes encode_int32_value(int32_t v);

/// Decodes an int32 valued entry. Tombstones decode to std::nullopt.
/// Throws std::invalid_argument when the payload is not four bytes long.
std::optional<int32_t> decode_int32_value(const entry& e);

} // namespace model

template<>
struct fmt::formatter<model::entry> : fmt::ostream_formatter {};
