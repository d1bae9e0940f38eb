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

#include <seastar/core/sstring.hh>

#include <fmt/ostream.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string_view>

namespace compaction {

/*
 * idle -> scanning_phase_one -> scanning_phase_two -> publishing -> idle
 *
 * Any scanning or publishing state may move to failed. A failed compactor
 * starts over from scanning_phase_one on its next run.
 */
enum class compaction_state : uint8_t {
    idle,
    scanning_phase_one,
    scanning_phase_two,
    publishing,
    failed,
};

std::string_view to_string_view(compaction_state);
std::ostream& operator<<(std::ostream&, compaction_state);

struct compaction_config {
    // upper bound on distinct keys per run, 0 for no bound
    size_t max_keys{0};
    size_t read_slice_entries{128};
    // write compacted logs under data_directory instead of keeping them
    // in memory only
    bool persist{false};
    std::filesystem::path data_directory;

    friend std::ostream& operator<<(std::ostream&, const compaction_config&);
};

/// Outcome of a single successful run.
struct run_stats {
    model::offset boundary;
    size_t entries_read{0};
    size_t keys_indexed{0};
    size_t tombstones{0};
    size_t entries_written{0};
    size_t bytes_written{0};
    std::chrono::milliseconds duration{0};

    friend std::ostream& operator<<(std::ostream&, const run_stats&);
};

struct compactor_stats {
    compaction_state state{compaction_state::idle};
    uint64_t runs_started{0};
    uint64_t runs_succeeded{0};
    uint64_t runs_failed{0};
    std::optional<run_stats> last_run;
    std::optional<ss::sstring> last_error;

    friend std::ostream& operator<<(std::ostream&, const compactor_stats&);
};

} // namespace compaction

template<>
struct fmt::formatter<compaction::compaction_state>
  : fmt::formatter<std::string_view> {
    template<typename FormatContext>
    auto format(compaction::compaction_state s, FormatContext& ctx) const {
        return fmt::formatter<std::string_view>::format(
          compaction::to_string_view(s), ctx);
    }
};
template<>
struct fmt::formatter<compaction::compaction_config> : fmt::ostream_formatter {
};
template<>
struct fmt::formatter<compaction::run_stats> : fmt::ostream_formatter {};
template<>
struct fmt::formatter<compaction::compactor_stats> : fmt::ostream_formatter {};
