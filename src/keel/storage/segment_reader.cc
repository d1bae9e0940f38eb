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

#include "storage/segment_reader.h"

#include "base/vlog.h"
#include "storage/exceptions.h"
#include "storage/logger.h"

#include <seastar/core/coroutine.hh>

#include <fmt/format.h>

#include <exception>

namespace storage {

ss::future<segment_reader::data_t>
segment_reader::do_load_slice(model::timeout_clock::time_point) {
    if (_config.abort_source) {
        _config.abort_source->get().check();
    }
    while (!is_end_of_stream()) {
        auto& seg = *_segments[_idx];
        data_t slice;
        try {
            slice = seg.read(
              _next, _config.end_offset, _config.max_entries_per_slice);
        } catch (const storage_exception& e) {
            klog(
              stlog.warn,
              "Failed reading segment {} at offset {}: {}",
              seg,
              _next,
              e.what());
            if (_probe && e.code() == errc::read_failure) {
                _probe->read_failed();
            }
            throw;
        }
        if (slice.empty()) {
            ++_idx;
            continue;
        }
        _next = model::next_offset(slice.back().offset);
        klog(
          stlog.trace,
          "Loaded {} entries, next offset {}",
          slice.size(),
          _next);
        co_return slice;
    }
    co_return data_t{};
}

void segment_reader::print(std::ostream& os) {
    fmt::print(
      os,
      "segment reader {}/{} segments, next offset {}, config {}",
      _idx,
      _segments.size(),
      _next,
      _config);
}

} // namespace storage
