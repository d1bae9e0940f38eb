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

#include "storage/mem_log.h"

#include "base/vassert.h"
#include "base/vlog.h"
#include "storage/entry_framing.h"
#include "storage/errc.h"
#include "storage/exceptions.h"
#include "storage/logger.h"
#include "storage/segment_reader.h"

#include <seastar/core/coroutine.hh>

#include <fmt/format.h>

#include <algorithm>
#include <stdexcept>

namespace storage {

mem_log::mem_log(log_config cfg)
  : _config(std::move(cfg)) {
    kassert(
      _config.max_segment_entries > 0,
      "Segments must hold at least one entry: {}",
      _config);
}

segment& mem_log::active_segment() {
    if (
      _segments.empty() || _segments.back()->is_sealed()
      || _segments.back()->entry_count() >= _config.max_segment_entries) {
        if (!_segments.empty()) {
            _segments.back()->seal();
        }
        _segments.push_back(ss::make_lw_shared<segment>(_next_offset));
        _probe.segment_created();
        klog(
          stlog.debug,
          "[{}] Rolled new segment at offset {}",
          _config.topic,
          _next_offset);
    }
    return *_segments.back();
}

ss::future<model::offset> mem_log::append(
  std::optional<ss::sstring> key, bytes payload, model::timestamp ts) {
    if (unlikely(_closed)) {
        return ss::make_exception_future<model::offset>(storage_exception(
          errc::log_closed,
          fmt::format("append to closed log {}", _config.topic)));
    }
    if (unlikely(!fits_in_frame(key ? key->size() : 0, payload.size()))) {
        return ss::make_exception_future<model::offset>(storage_exception(
          errc::entry_too_large,
          fmt::format(
            "append to {} of a {} byte payload exceeds the frame size limit",
            _config.topic,
            payload.size())));
    }
    model::entry e{
      .offset = _next_offset,
      .key = std::move(key),
      .payload = std::move(payload),
      .timestamp = ts,
    };
    auto& seg = active_segment();
    const auto before = seg.size_bytes();
    seg.append(e);
    _probe.entry_appended(seg.size_bytes() - before);
    klog(stlog.trace, "[{}] Appended {}", _config.topic, e);
    _next_offset = model::next_offset(_next_offset);
    return ss::make_ready_future<model::offset>(e.offset);
}

ss::future<model::entry_reader> mem_log::make_reader(log_reader_config cfg) {
    if (unlikely(cfg.read_compacted)) {
        return ss::make_exception_future<model::entry_reader>(
          std::invalid_argument(fmt::format(
            "raw log {} cannot serve a read_compacted reader",
            _config.topic)));
    }
    if (unlikely(_closed)) {
        return ss::make_exception_future<model::entry_reader>(
          storage_exception(
            errc::log_closed,
            fmt::format("read from closed log {}", _config.topic)));
    }
    cfg.start_offset = std::max(cfg.start_offset, _start_offset);
    cfg.end_offset = std::min(cfg.end_offset, _next_offset);

    segment_reader::segment_set set;
    for (const auto& seg : _segments) {
        if (seg->empty() || seg->last_offset() < cfg.start_offset) {
            continue;
        }
        if (seg->base_offset() >= cfg.end_offset) {
            break;
        }
        set.push_back(seg);
    }
    klog(
      stlog.trace,
      "[{}] Created reader over {} segments, {}",
      _config.topic,
      set.size(),
      cfg);
    return ss::make_ready_future<model::entry_reader>(
      model::make_entry_reader<segment_reader>(
        std::move(set), std::move(cfg), &_probe));
}

offset_stats mem_log::offsets() const {
    return offset_stats{
      .start_offset = _start_offset,
      .dirty_offset = model::prev_offset(_next_offset),
      .next_offset = _next_offset,
    };
}

ss::future<> mem_log::truncate_prefix(model::offset o) {
    o = std::min(o, _next_offset);
    if (o <= _start_offset) {
        co_return;
    }
    klog(
      stlog.info,
      "[{}] Truncating prefix below offset {}",
      _config.topic,
      o);
    _start_offset = o;
    while (!_segments.empty() && !_segments.front()->empty()
           && _segments.front()->last_offset() < o) {
        _segments.front()->close();
        _segments.pop_front();
        _probe.segment_removed();
    }
}

log_stats mem_log::stats() const {
    log_stats s{
      .segment_count = _segments.size(),
      .offsets = offsets(),
    };
    for (const auto& seg : _segments) {
        s.entry_count += seg->entry_count();
        s.size_bytes += seg->size_bytes();
    }
    return s;
}

ss::future<> mem_log::close() {
    if (_closed) {
        co_return;
    }
    klog(stlog.debug, "[{}] Closing log", _config.topic);
    _closed = true;
    _probe.clear_metrics();
    for (auto& seg : _segments) {
        seg->close();
    }
    _segments.clear();
}

} // namespace storage
