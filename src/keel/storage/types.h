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
#include "model/fundamental.h"

#include <seastar/core/abort_source.hh>

#include <fmt/ostream.h>

#include <cstddef>
#include <functional>
#include <iosfwd>
#include <optional>

namespace storage {

using opt_abort_source_t
  = std::optional<std::reference_wrapper<ss::abort_source>>;

struct log_config {
    model::topic topic;
    // a new segment is rolled once the active one holds this many entries
    size_t max_segment_entries{1000};

    friend std::ostream& operator<<(std::ostream&, const log_config&);
};

struct log_reader_config {
    static constexpr size_t default_max_entries_per_slice = 128;

    model::offset start_offset;
    // exclusive
    model::offset end_offset;
    size_t max_entries_per_slice{default_max_entries_per_slice};

    /// Serve the deduplicated view below the published compaction boundary
    /// instead of the full history.
    bool read_compacted{false};

    /// abort source for read operations
    opt_abort_source_t abort_source;

    /**
     * Read offsets [start, end).
     */
    log_reader_config(
      model::offset start_offset,
      model::offset end_offset,
      opt_abort_source_t as = std::nullopt)
      : start_offset(start_offset)
      , end_offset(end_offset)
      , abort_source(as) {}

    /**
     * Read everything from `start_offset` on.
     */
    explicit log_reader_config(model::offset start_offset)
      : log_reader_config(start_offset, model::offset::max()) {}

    friend std::ostream& operator<<(std::ostream&, const log_reader_config&);
};

struct offset_stats {
    // first readable offset, advanced by prefix truncation
    model::offset start_offset{0};
    // last written offset, the sentinel when nothing was written
    model::offset dirty_offset;
    // offset the next append will be assigned
    model::offset next_offset{0};

    friend std::ostream& operator<<(std::ostream&, const offset_stats&);
};

struct log_stats {
    size_t segment_count{0};
    size_t entry_count{0};
    size_t size_bytes{0};
    offset_stats offsets;

    friend std::ostream& operator<<(std::ostream&, const log_stats&);
};

} // namespace storage

template<>
struct fmt::formatter<storage::log_config> : fmt::ostream_formatter {};
template<>
struct fmt::formatter<storage::log_reader_config> : fmt::ostream_formatter {};
template<>
struct fmt::formatter<storage::offset_stats> : fmt::ostream_formatter {};
template<>
struct fmt::formatter<storage::log_stats> : fmt::ostream_formatter {};
