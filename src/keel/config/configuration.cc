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

#include "config/configuration.h"

#include <fmt/format.h>

#include <optional>
#include <stdexcept>

namespace config {

namespace {

std::optional<ss::sstring> positive(const size_t& v) {
    if (v == 0) {
        return "must be greater than zero";
    }
    return std::nullopt;
}

} // namespace

configuration::configuration()
  : data_directory(
      *this,
      "data_directory",
      "Directory under which compacted logs are persisted",
      {.example = "/var/lib/keel/data"},
      "")
  , log_segment_max_entries(
      *this,
      "log_segment_max_entries",
      "Number of entries after which the raw log rolls a new segment",
      {.example = "1000"},
      1000,
      positive)
  , compaction_max_keys(
      *this,
      "compaction_max_keys",
      "Maximum number of distinct keys a single compaction run may index. "
      "Zero means unbounded; otherwise the key index is allocated up front.",
      {.example = "100000"},
      0)
  , compaction_read_slice_entries(
      *this,
      "compaction_read_slice_entries",
      "Number of entries a compaction pass loads from the log at a time",
      {.example = "128"},
      128,
      positive)
  , compaction_persist_logs(
      *this,
      "compaction_persist_logs",
      "Write compacted logs to data_directory instead of keeping them in "
      "memory only",
      {},
      false) {}

configuration::error_map_t configuration::load(const YAML::Node& root) {
    if (!root["keel"]) {
        throw std::invalid_argument("Missing keel config");
    }
    auto errors = read_yaml(root["keel"]);
    if (compaction_persist_logs() && data_directory().empty()) {
        const auto& name = compaction_persist_logs.name();
        errors[ss::sstring(name.data(), name.size())]
          = "Validation error: requires data_directory to be set";
    }
    return errors;
}

configuration& shard_local_cfg() {
    static thread_local configuration cfg;
    return cfg;
}

} // namespace config
