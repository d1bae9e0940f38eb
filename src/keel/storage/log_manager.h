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
#include "storage/log.h"
#include "storage/types.h"

#include <seastar/core/future.hh>
#include <seastar/core/gate.hh>
#include <seastar/core/shared_ptr.hh>

#include <absl/container/btree_map.h>

#include <vector>

namespace storage {

struct log_manager_config {
    size_t max_segment_entries{1000};
};

/// Registry of the logs of every topic on this shard.
class log_manager {
public:
    explicit log_manager(log_manager_config cfg) noexcept
      : _config(cfg) {}

    /// Returns the log of `topic`, creating it on first use.
    ss::future<ss::shared_ptr<log>> manage(model::topic topic);

    /// The log of `topic` or nullptr when it is not managed.
    ss::shared_ptr<log> get(const model::topic& topic) const;

    /// Closes and forgets the log of `topic`.
    ss::future<> remove(model::topic topic);

    std::vector<model::topic> topics() const;
    size_t size() const { return _logs.size(); }

    ss::future<> stop();

private:
    log_manager_config _config;
    absl::btree_map<model::topic, ss::shared_ptr<log>> _logs;
    ss::gate _gate;
};

} // namespace storage
