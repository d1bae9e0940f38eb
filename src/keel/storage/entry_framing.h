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
#include "model/entry.h"

#include <seastar/core/temporary_buffer.hh>

#include <cstddef>
#include <cstdint>
#include <limits>
#include <string_view>

namespace storage {

/*
 * Every segment, raw or compacted, is a concatenation of frames. All integers
 * are little endian.
 *
 *   int32  size          bytes following this field
 *   uint32 crc           crc32c of everything following this field
 *   int64  offset
 *   int64  timestamp     milliseconds since epoch
 *   int32  key_len       -1 when the entry has no key
 *   bytes  key
 *   int32  payload_len
 *   bytes  payload
 */
inline constexpr size_t frame_size_field_size = sizeof(int32_t);
inline constexpr size_t frame_overhead = sizeof(int32_t) + sizeof(uint32_t)
                                         + sizeof(int64_t) + sizeof(int64_t)
                                         + sizeof(int32_t) + sizeof(int32_t);

/// The size field is an int32, which caps key and payload together.
inline constexpr bool fits_in_frame(size_t key_size, size_t payload_size) {
    constexpr size_t max_body = static_cast<size_t>(
                                  std::numeric_limits<int32_t>::max())
                                - (frame_overhead - frame_size_field_size);
    return key_size <= max_body && payload_size <= max_body - key_size;
}

/// Throws storage_exception with errc::entry_too_large when the entry does
/// not fit in a frame.
ss::temporary_buffer<char> encode_frame(const model::entry&);

struct decoded_frame {
    model::entry entry;
    // bytes of the input taken by this frame, size field included
    size_t frame_size;
};

/// Decodes the frame at the front of `buf`. Throws storage_exception with
/// errc::corrupted_frame when the frame is truncated or fails its checksum.
decoded_frame decode_frame(std::string_view buf);

/// Walks the frames of a contiguous buffer, e.g. a segment file.
class frame_parser {
public:
    explicit frame_parser(std::string_view buf) noexcept
      : _buf(buf) {}

    bool end_of_stream() const { return _consumed >= _buf.size(); }

    model::entry next();

    size_t bytes_consumed() const { return _consumed; }

private:
    std::string_view _buf;
    size_t _consumed{0};
};

} // namespace storage
