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

#include "storage/log_manager.h"

#include "base/vlog.h"
#include "storage/logger.h"
#include "storage/mem_log.h"

#include <seastar/core/coroutine.hh>

namespace storage {

ss::future<ss::shared_ptr<log>> log_manager::manage(model::topic topic) {
    auto holder = _gate.hold();
    if (auto it = _logs.find(topic); it != _logs.end()) {
        co_return it->second;
    }
    auto l = ss::make_shared<mem_log>(log_config{
      .topic = topic,
      .max_segment_entries = _config.max_segment_entries,
    });
    l->get_probe().setup_metrics(topic);
    klog(stlog.info, "Managing log {}", l->config());
    ss::shared_ptr<log> ret = std::move(l);
    _logs.emplace(std::move(topic), ret);
    co_return ret;
}

ss::shared_ptr<log> log_manager::get(const model::topic& topic) const {
    if (auto it = _logs.find(topic); it != _logs.end()) {
        return it->second;
    }
    return nullptr;
}

ss::future<> log_manager::remove(model::topic topic) {
    auto holder = _gate.hold();
    auto it = _logs.find(topic);
    if (it == _logs.end()) {
        co_return;
    }
    auto l = std::move(it->second);
    _logs.erase(it);
    klog(stlog.info, "Removing log {}", topic);
    co_await l->close();
}

std::vector<model::topic> log_manager::topics() const {
    std::vector<model::topic> ret;
    ret.reserve(_logs.size());
    for (const auto& [topic, _] : _logs) {
        ret.push_back(topic);
    }
    return ret;
}

ss::future<> log_manager::stop() {
    klog(stlog.info, "Stopping log manager with {} logs", _logs.size());
    co_await _gate.close();
    auto logs = std::exchange(_logs, {});
    for (auto& [_, l] : logs) {
        co_await l->close();
    }
}

} // namespace storage
