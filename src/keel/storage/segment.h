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
#include "model/entry_reader.h"
#include "model/fundamental.h"

#include <seastar/core/iostream.hh>
#include <seastar/core/shared_ptr.hh>
#include <seastar/core/temporary_buffer.hh>

#include <fmt/ostream.h>

#include <iosfwd>
#include <vector>

namespace storage {

/// An append-only run of framed entries. Entries are kept encoded so that
/// every read goes through the frame parser, the same way a segment file is
/// read back.
class segment {
public:
    explicit segment(model::offset base_offset) noexcept
      : _base_offset(base_offset) {}

    segment(const segment&) = delete;
    segment& operator=(const segment&) = delete;
    segment(segment&&) noexcept = default;
    segment& operator=(segment&&) noexcept = default;
    ~segment() noexcept = default;

    model::offset base_offset() const { return _base_offset; }
    /// Offset of the last appended entry, the sentinel when empty.
    model::offset last_offset() const {
        return _offsets.empty() ? model::offset{} : _offsets.back();
    }
    size_t entry_count() const { return _offsets.size(); }
    size_t size_bytes() const { return _size_bytes; }
    bool empty() const { return _offsets.empty(); }

    bool is_sealed() const { return _sealed; }
    /// No further appends are accepted once sealed.
    void seal() { _sealed = true; }

    bool is_closed() const { return _closed; }
    /// Drops the segment contents. Reads of a closed segment fail with
    /// errc::read_failure.
    void close();

    void append(const model::entry&);
    void append_frame(model::offset, ss::temporary_buffer<char>);

    /// Decodes up to `max_entries` entries with offsets in [start, end).
    model::entry_reader::data_t
    read(model::offset start, model::offset end, size_t max_entries) const;

    /// Writes every frame to `out`. Does not flush.
    ss::future<> write_to(ss::output_stream<char>& out) const;

    /// Parses a buffer of concatenated frames, as produced by write_to.
    static segment
    from_buffer(model::offset base_offset, ss::temporary_buffer<char> buf);

    friend std::ostream& operator<<(std::ostream&, const segment&);

private:
    model::offset _base_offset;
    std::vector<model::offset> _offsets;
    std::vector<ss::temporary_buffer<char>> _frames;
    size_t _size_bytes{0};
    bool _sealed{false};
    bool _closed{false};
};

} // namespace storage

template<>
struct fmt::formatter<storage::segment> : fmt::ostream_formatter {};
