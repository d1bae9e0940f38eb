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

#include "compaction/types.h"

#include <fmt/format.h>
#include <fmt/ostream.h>

#include <ostream>

namespace compaction {

std::string_view to_string_view(compaction_state s) {
    switch (s) {
    case compaction_state::idle:
        return "idle";
    case compaction_state::scanning_phase_one:
        return "scanning_phase_one";
    case compaction_state::scanning_phase_two:
        return "scanning_phase_two";
    case compaction_state::publishing:
        return "publishing";
    case compaction_state::failed:
        return "failed";
    }
    return "unknown";
}

std::ostream& operator<<(std::ostream& o, compaction_state s) {
    return o << to_string_view(s);
}

std::ostream& operator<<(std::ostream& o, const compaction_config& cfg) {
    fmt::print(
      o,
      "{{max_keys: {}, read_slice_entries: {}, persist: {}, "
      "data_directory: {}}}",
      cfg.max_keys,
      cfg.read_slice_entries,
      cfg.persist,
      cfg.data_directory.native());
    return o;
}

std::ostream& operator<<(std::ostream& o, const run_stats& s) {
    fmt::print(
      o,
      "{{boundary: {}, entries_read: {}, keys_indexed: {}, tombstones: {}, "
      "entries_written: {}, bytes_written: {}, duration: {}ms}}",
      s.boundary,
      s.entries_read,
      s.keys_indexed,
      s.tombstones,
      s.entries_written,
      s.bytes_written,
      s.duration.count());
    return o;
}

std::ostream& operator<<(std::ostream& o, const compactor_stats& s) {
    fmt::print(
      o,
      "{{state: {}, runs_started: {}, runs_succeeded: {}, runs_failed: {}",
      s.state,
      s.runs_started,
      s.runs_succeeded,
      s.runs_failed);
    if (s.last_run) {
        fmt::print(o, ", last_run: {}", *s.last_run);
    }
    if (s.last_error) {
        fmt::print(o, ", last_error: {}", *s.last_error);
    }
    o << "}";
    return o;
}

} // namespace compaction
