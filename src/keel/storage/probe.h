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

namespace storage {

// Per log counters. Also backs log::stats().
class probe {
public:
    void entry_appended(size_t bytes) {
        ++_entries_appended;
        _bytes_appended += bytes;
    }
    void segment_created() { ++_segments_created; }
    void segment_removed() { ++_segments_removed; }
    void read_failed() { ++_read_failures; }

    uint64_t entries_appended() const { return _entries_appended; }
    uint64_t bytes_appended() const { return _bytes_appended; }
    uint64_t segments_created() const { return _segments_created; }
    uint64_t segments_removed() const { return _segments_removed; }
    uint64_t read_failures() const { return _read_failures; }

    void setup_metrics(const model::topic&);
    void clear_metrics() { _metrics.clear(); }

private:
    uint64_t _entries_appended{0};
    uint64_t _bytes_appended{0};
    uint64_t _segments_created{0};
    uint64_t _segments_removed{0};
    uint64_t _read_failures{0};

    ss::metrics::metric_groups _metrics;
};

} // namespace storage
