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

#include "storage/log.h"
#include "storage/probe.h"
#include "storage/segment.h"
#include "storage/types.h"

#include <seastar/core/shared_ptr.hh>

#include <deque>

namespace storage {

/// In memory implementation of the raw log. Segments are rolled once the
/// active one reaches log_config::max_segment_entries entries.
class mem_log final : public log {
public:
    explicit mem_log(log_config);

    const model::topic& topic() const final { return _config.topic; }

    ss::future<model::offset> append(
      std::optional<ss::sstring> key,
      bytes payload,
      model::timestamp ts = model::timestamp::now()) final;

    ss::future<model::entry_reader> make_reader(log_reader_config) final;

    offset_stats offsets() const final;

    ss::future<> truncate_prefix(model::offset) final;

    size_t segment_count() const final { return _segments.size(); }

    log_stats stats() const final;

    ss::future<> close() final;

    const log_config& config() const { return _config; }
    probe& get_probe() { return _probe; }

private:
    segment& active_segment();

    log_config _config;
    std::deque<ss::lw_shared_ptr<segment>> _segments;
    model::offset _start_offset{0};
    model::offset _next_offset{0};
    bool _closed{false};
    probe _probe;
};

} // namespace storage
