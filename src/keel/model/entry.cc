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

#include "model/entry.h"

#include <seastar/core/byteorder.hh>

#include <fmt/format.h>

#include <ostream>
#include <stdexcept>

namespace model {

std::ostream& operator<<(std::ostream& o, timestamp ts) {
    if (ts != timestamp::missing()) {
        return o << "{timestamp: " << ts.value() << "}";
    }
    return o << "{timestamp: missing}";
}

std::ostream& operator<<(std::ostream& o, const entry& e) {
    fmt::print(
      o,
      "{{offset: {}, key: {}, payload_size: {}, tombstone: {}, {}}}",
      e.offset,
      e.key ? *e.key : ss::sstring("<none>"),
      e.payload.size(),
      e.is_tombstone(),
      e.timestamp);
    return o;
}

bytes encode_int32_value(int32_t v) {
    bytes out(bytes::initialized_later{}, sizeof(int32_t));
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    ss::write_be(reinterpret_cast<char*>(out.data()), v);
    return out;
}

std::optional<int32_t> decode_int32_value(const entry& e) {
    auto v = e.value();
    if (!v) {
        return std::nullopt;
    }
    if (v->size() != sizeof(int32_t)) {
        throw std::invalid_argument(fmt::format(
          "int32 value at offset {} has {} bytes", e.offset, v->size()));
    }
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    return ss::read_be<int32_t>(reinterpret_cast<const char*>(v->data()));
}

} // namespace model
