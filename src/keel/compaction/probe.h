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

#include <seastar/core/metrics_registration.hh>

#include <cstdint>

namespace compaction {

class probe {
public:
    void run_started() { ++_runs_started; }
    void run_succeeded(size_t entries_read, size_t entries_written) {
        ++_runs_succeeded;
        _entries_read += entries_read;
        _entries_written += entries_written;
    }
    void run_failed() { ++_runs_failed; }
    void pointer_swap_failed() { ++_pointer_swap_failures; }
    void log_retired() { ++_logs_retired; }

    uint64_t runs_started() const { return _runs_started; }
    uint64_t runs_succeeded() const { return _runs_succeeded; }
    uint64_t runs_failed() const { return _runs_failed; }
    uint64_t pointer_swap_failures() const { return _pointer_swap_failures; }
    uint64_t logs_retired() const { return _logs_retired; }

    void setup_metrics(const model::topic&);
    void clear_metrics() { _metrics.clear(); }

private:
    uint64_t _runs_started{0};
    uint64_t _runs_succeeded{0};
    uint64_t _runs_failed{0};
    uint64_t _pointer_swap_failures{0};
    uint64_t _logs_retired{0};
    uint64_t _entries_read{0};
    uint64_t _entries_written{0};

    ss::metrics::metric_groups _metrics;
};

} // namespace compaction
