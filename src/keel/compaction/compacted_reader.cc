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

#include "compaction/compacted_reader.h"

#include "base/vlog.h"
#include "compaction/logger.h"

#include <seastar/core/coroutine.hh>

#include <algorithm>
#include <vector>

namespace compaction {

ss::future<model::entry_reader> make_compacted_reader(
  storage::log& log,
  const compacted_log_pointer& pointer,
  storage::log_reader_config cfg) {
    if (!cfg.read_compacted) {
        co_return co_await log.make_reader(std::move(cfg));
    }
    cfg.read_compacted = false;
    // pin the published log before the first suspension point
    auto current = pointer.get();
    if (!current) {
        co_return co_await log.make_reader(std::move(cfg));
    }

    const auto boundary = current->boundary();
    std::vector<model::entry_reader> readers;
    if (cfg.start_offset < boundary) {
        auto compacted_cfg = cfg;
        compacted_cfg.end_offset = std::min(cfg.end_offset, boundary);
        readers.push_back(current->make_reader(std::move(compacted_cfg)));
    }
    if (cfg.end_offset > boundary) {
        auto raw_cfg = cfg;
        raw_cfg.start_offset = std::max(cfg.start_offset, boundary);
        readers.push_back(co_await log.make_reader(std::move(raw_cfg)));
    }
    klog(
      cmplog.trace,
      "[{}] Read compacted {} split at boundary {} into {} readers",
      log.topic(),
      cfg,
      boundary,
      readers.size());
    co_return model::make_concatenating_entry_reader(std::move(readers));
}

} // namespace compaction
