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
#include "utils/mutex.h"

#include <seastar/core/future.hh>
#include <seastar/core/gate.hh>
#include <seastar/util/noncopyable_function.hh>

#include <absl/container/btree_map.h>

#include <memory>

namespace compaction {

/// Decides when a compaction run for a topic may execute. Implementations
/// must not run two tasks for the same topic at once.
class scheduler {
public:
    using task = ss::noncopyable_function<ss::future<>()>;

    scheduler() = default;
    scheduler(const scheduler&) = delete;
    scheduler& operator=(const scheduler&) = delete;
    scheduler(scheduler&&) = delete;
    scheduler& operator=(scheduler&&) = delete;
    virtual ~scheduler() = default;

    virtual ss::future<> run_exclusive(model::topic, task) = 0;

    virtual ss::future<> stop() = 0;
};

/// Serializes runs per topic with a mutex. Different topics run
/// concurrently.
class per_topic_mutex_scheduler final : public scheduler {
public:
    ss::future<> run_exclusive(model::topic, task) final;

    ss::future<> stop() final;

    /// Runs waiting on the lock of \p topic.
    size_t waiters(const model::topic& topic) const;

private:
    absl::btree_map<model::topic, std::unique_ptr<mutex>> _locks;
    ss::gate _gate;
};

} // namespace compaction
