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

#include "storage/types.h"

#include <fmt/format.h>
#include <fmt/ostream.h>

#include <ostream>

namespace storage {

std::ostream& operator<<(std::ostream& o, const log_config& cfg) {
    fmt::print(
      o,
      "{{topic: {}, max_segment_entries: {}}}",
      cfg.topic,
      cfg.max_segment_entries);
    return o;
}

std::ostream& operator<<(std::ostream& o, const log_reader_config& cfg) {
    fmt::print(
      o,
      "{{start_offset: {}, end_offset: {}, max_entries_per_slice: {}, "
      "read_compacted: {}, abort_source: {}}}",
      cfg.start_offset,
      cfg.end_offset,
      cfg.max_entries_per_slice,
      cfg.read_compacted,
      cfg.abort_source.has_value());
    return o;
}

std::ostream& operator<<(std::ostream& o, const offset_stats& s) {
    fmt::print(
      o,
      "{{start_offset: {}, dirty_offset: {}, next_offset: {}}}",
      s.start_offset,
      s.dirty_offset,
      s.next_offset);
    return o;
}

std::ostream& operator<<(std::ostream& o, const log_stats& s) {
    fmt::print(
      o,
      "{{segment_count: {}, entry_count: {}, size_bytes: {}, offsets: {}}}",
      s.segment_count,
      s.entry_count,
      s.size_bytes,
      s.offsets);
    return o;
}

} // namespace storage
