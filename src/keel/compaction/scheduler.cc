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

#include "compaction/scheduler.h"

#include "base/vlog.h"
#include "compaction/logger.h"

#include <seastar/core/coroutine.hh>

#include <fmt/format.h>

namespace compaction {

ss::future<>
per_topic_mutex_scheduler::run_exclusive(model::topic topic, task t) {
    auto holder = _gate.hold();
    auto it = _locks.find(topic);
    if (it == _locks.end()) {
        it = _locks
               .emplace(
                 topic,
                 std::make_unique<mutex>(ss::sstring(
                   fmt::format("compaction::scheduler::{}", topic))))
               .first;
    }
    auto& m = *it->second;
    if (!m.ready()) {
        klog(
          cmplog.debug,
          "[{}] Compaction already running, queued behind {} waiters",
          topic,
          m.waiters());
    }
    auto units = co_await m.get_units();
    co_await t();
}

ss::future<> per_topic_mutex_scheduler::stop() {
    for (auto& [_, m] : _locks) {
        m->broken();
    }
    co_await _gate.close();
}

size_t per_topic_mutex_scheduler::waiters(const model::topic& topic) const {
    auto it = _locks.find(topic);
    return it == _locks.end() ? 0 : it->second->waiters();
}

} // namespace compaction
