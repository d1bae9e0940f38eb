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
#include "compaction/compactor.h"
#include "compaction/scheduler.h"
#include "compaction/types.h"
#include "model/entry_reader.h"
#include "model/fundamental.h"
#include "storage/log_manager.h"
#include "storage/types.h"

#include <seastar/core/future.hh>
#include <seastar/core/gate.hh>
#include <seastar/core/sstring.hh>

#include <absl/container/btree_map.h>

#include <filesystem>
#include <memory>
#include <optional>

namespace compaction {

struct compacted_log_stats {
    model::offset boundary;
    size_t entry_count{0};
    size_t size_bytes{0};
    std::optional<std::filesystem::path> file;
    size_t active_readers{0};
};

/// Everything internal_stats() reports about one topic.
struct topic_stats {
    model::topic topic;
    storage::log_stats log;
    compactor_stats compactor;
    uint64_t pointer_version{0};
    std::optional<compacted_log_stats> compacted;
};

/// Renders \p stats as indented JSON.
ss::sstring to_json(const topic_stats& stats);

/**
 * Entry point for compaction on a shard: triggers runs through the
 * scheduler and serves readers of the logs it compacts.
 */
class compaction_service {
public:
    compaction_service(
      storage::log_manager& logs,
      compaction_config cfg,
      std::unique_ptr<scheduler> sched = nullptr);

    compaction_service(const compaction_service&) = delete;
    compaction_service& operator=(const compaction_service&) = delete;
    compaction_service(compaction_service&&) = delete;
    compaction_service& operator=(compaction_service&&) = delete;
    ~compaction_service() noexcept = default;

    /// Compacts \p topic once. Resolves when the result is published;
    /// fails with compaction_exception otherwise.
    ss::future<> compact(model::topic topic);

    /// Reader over \p topic, compacted or raw depending on
    /// cfg.read_compacted.
    ss::future<model::entry_reader>
    make_reader(model::topic topic, storage::log_reader_config cfg);

    topic_stats internal_stats(const model::topic& topic);

    /// The compactor of \p topic, nullptr before its first run.
    compactor* get_compactor(const model::topic& topic);

    const compaction_config& config() const { return _config; }

    ss::future<> stop();

private:
    compactor& get_or_create(const model::topic& topic);

    storage::log_manager& _logs;
    compaction_config _config;
    std::unique_ptr<scheduler> _scheduler;
    absl::btree_map<model::topic, std::unique_ptr<compactor>> _compactors;
    ss::gate _gate;
};

} // namespace compaction
