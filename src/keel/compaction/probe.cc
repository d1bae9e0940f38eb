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

#include "compaction/probe.h"

#include <seastar/core/metrics.hh>

#include <vector>

namespace compaction {

void probe::setup_metrics(const model::topic& topic) {
    namespace sm = ss::metrics;
    auto topic_label = sm::label("topic");
    const std::vector<sm::label_instance> labels = {topic_label(topic())};

    _metrics.add_group(
      "keel_compaction",
      {
        sm::make_counter(
          "runs_started",
          [this] { return _runs_started; },
          sm::description("Number of compaction runs started"),
          labels),
        sm::make_counter(
          "runs_succeeded",
          [this] { return _runs_succeeded; },
          sm::description("Number of runs that published a compacted log"),
          labels),
        sm::make_counter(
          "runs_failed",
          [this] { return _runs_failed; },
          sm::description("Number of runs that failed"),
          labels),
        sm::make_counter(
          "pointer_swap_failures",
          [this] { return _pointer_swap_failures; },
          sm::description("Number of runs that lost the publish race"),
          labels),
        sm::make_counter(
          "logs_retired",
          [this] { return _logs_retired; },
          sm::description("Number of superseded compacted logs reclaimed"),
          labels),
        sm::make_counter(
          "entries_read",
          [this] { return _entries_read; },
          sm::description("Number of raw entries indexed by successful runs"),
          labels),
        sm::make_counter(
          "entries_written",
          [this] { return _entries_written; },
          sm::description("Number of entries written to compacted logs"),
          labels),
      });
}

} // namespace compaction
