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

#include "compaction/service.h"

#include "base/vlog.h"
#include "compaction/compacted_log_writer.h"
#include "compaction/errc.h"
#include "compaction/exceptions.h"
#include "compaction/logger.h"

#include <seastar/core/coroutine.hh>

#include <fmt/format.h>

namespace compaction {

compaction_service::compaction_service(
  storage::log_manager& logs,
  compaction_config cfg,
  std::unique_ptr<scheduler> sched)
  : _logs(logs)
  , _config(std::move(cfg))
  , _scheduler(
      sched ? std::move(sched)
            : std::make_unique<per_topic_mutex_scheduler>()) {}

compactor& compaction_service::get_or_create(const model::topic& topic) {
    if (auto it = _compactors.find(topic); it != _compactors.end()) {
        return *it->second;
    }
    auto log = _logs.get(topic);
    if (!log) {
        throw compaction_exception(
          errc::topic_not_found, fmt::format("no log for topic {}", topic));
    }
    auto c = std::make_unique<compactor>(
      log,
      _config,
      _config.persist ? make_file_writer_factory(_config.data_directory)
                      : make_memory_writer_factory());
    c->get_probe().setup_metrics(topic);
    klog(cmplog.debug, "[{}] Created compactor, config {}", topic, _config);
    return *_compactors.emplace(topic, std::move(c)).first->second;
}

compactor* compaction_service::get_compactor(const model::topic& topic) {
    auto it = _compactors.find(topic);
    return it == _compactors.end() ? nullptr : it->second.get();
}

ss::future<> compaction_service::compact(model::topic topic) {
    auto holder = _gate.hold();
    auto& c = get_or_create(topic);
    co_await _scheduler->run_exclusive(
      topic, [&c]() -> ss::future<> { co_await c.compact(); });
}

ss::future<model::entry_reader> compaction_service::make_reader(
  model::topic topic, storage::log_reader_config cfg) {
    auto holder = _gate.hold();
    if (auto* c = get_compactor(topic)) {
        co_return co_await c->make_reader(std::move(cfg));
    }
    auto log = _logs.get(topic);
    if (!log) {
        throw compaction_exception(
          errc::topic_not_found, fmt::format("no log for topic {}", topic));
    }
    // nothing was ever published for this topic, so the view is raw
    cfg.read_compacted = false;
    co_return co_await log->make_reader(std::move(cfg));
}

topic_stats compaction_service::internal_stats(const model::topic& topic) {
    auto log = _logs.get(topic);
    if (!log) {
        throw compaction_exception(
          errc::topic_not_found, fmt::format("no log for topic {}", topic));
    }
    topic_stats ret{
      .topic = topic,
      .log = log->stats(),
    };
    if (auto* c = get_compactor(topic)) {
        ret.compactor = c->stats();
        ret.pointer_version = c->pointer().version();
        if (auto current = c->pointer().get()) {
            ret.compacted = compacted_log_stats{
              .boundary = current->boundary(),
              .entry_count = current->entry_count(),
              .size_bytes = current->size_bytes(),
              .file = current->file(),
              .active_readers = current->active_readers(),
            };
        }
    }
    return ret;
}

ss::future<> compaction_service::stop() {
    klog(cmplog.info, "Stopping compaction service");
    for (auto& [_, c] : _compactors) {
        co_await c->stop();
    }
    co_await _scheduler->stop();
    co_await _gate.close();
}

} // namespace compaction
