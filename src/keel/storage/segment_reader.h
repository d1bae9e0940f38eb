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
#include "model/entry_reader.h"
#include "storage/probe.h"
#include "storage/segment.h"
#include "storage/types.h"

#include <seastar/core/shared_ptr.hh>

#include <vector>

namespace storage {

/// Reads [start, end) across a fixed set of segments captured when the
/// reader was created. Segments removed by prefix truncation after that
/// point fail the read with errc::read_failure.
class segment_reader final : public model::entry_reader::impl {
public:
    using data_t = model::entry_reader::data_t;
    using segment_set = std::vector<ss::lw_shared_ptr<segment>>;

    segment_reader(
      segment_set segments,
      log_reader_config cfg,
      probe* probe = nullptr) noexcept
      : _segments(std::move(segments))
      , _config(std::move(cfg))
      , _next(_config.start_offset)
      , _probe(probe) {}

    bool is_end_of_stream() const final {
        return _idx >= _segments.size() || _next >= _config.end_offset;
    }

    ss::future<data_t> do_load_slice(model::timeout_clock::time_point) final;

    void print(std::ostream&) final;

private:
    segment_set _segments;
    log_reader_config _config;
    size_t _idx{0};
    model::offset _next;
    probe* _probe;
};

} // namespace storage
