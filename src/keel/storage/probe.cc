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

#include "storage/probe.h"

#include <seastar/core/metrics.hh>

#include <vector>

namespace storage {

void probe::setup_metrics(const model::topic& topic) {
    namespace sm = ss::metrics;
    auto topic_label = sm::label("topic");
    const std::vector<sm::label_instance> labels = {topic_label(topic())};

    _metrics.add_group(
      "keel_storage_log",
      {
        sm::make_counter(
          "entries_appended",
          [this] { return _entries_appended; },
          sm::description("Number of entries appended to the log"),
          labels),
        sm::make_counter(
          "bytes_appended",
          [this] { return _bytes_appended; },
          sm::description("Number of framed bytes appended to the log"),
          labels),
        sm::make_counter(
          "segments_created",
          [this] { return _segments_created; },
          sm::description("Number of segments rolled"),
          labels),
        sm::make_counter(
          "segments_removed",
          [this] { return _segments_removed; },
          sm::description("Number of segments removed by prefix truncation"),
          labels),
        sm::make_counter(
          "read_failures",
          [this] { return _read_failures; },
          sm::description("Number of reads that hit a removed segment"),
          labels),
      });
}

} // namespace storage
