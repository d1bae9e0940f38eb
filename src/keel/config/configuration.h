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
#include "config/config_store.h"
#include "config/property.h"

#include <seastar/core/sstring.hh>

#include <yaml-cpp/yaml.h>

#include <cstddef>

namespace config {

struct configuration final : public config_store {
    // storage
    property<ss::sstring> data_directory;
    property<size_t> log_segment_max_entries;

    // compaction
    property<size_t> compaction_max_keys;
    property<size_t> compaction_read_slice_entries;
    property<bool> compaction_persist_logs;

    configuration();

    /// Loads the properties under the `keel` key of \p root. Errors that
    /// span properties are reported alongside the per property ones.
    error_map_t load(const YAML::Node& root);
};

configuration& shard_local_cfg();

} // namespace config
