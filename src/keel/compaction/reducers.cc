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

#include "compaction/reducers.h"

#include "base/vlog.h"
#include "compaction/errc.h"
#include "compaction/exceptions.h"
#include "compaction/logger.h"

#include <seastar/core/coroutine.hh>

#include <fmt/format.h>

#include <exception>

namespace compaction {

ss::future<ss::stop_iteration> index_builder_reducer::operator()(model::entry e) {
    if (_as) {
        _as->check();
    }
    ++_result.entries_read;
    _result.last_offset = e.offset;
    if (!e.has_key()) {
        co_return ss::stop_iteration::no;
    }
    ++_result.keyed_entries;
    const auto tombstone = e.is_tombstone();
    const bool ok = co_await _index->put(
      *e.key, key_record{.offset = e.offset, .tombstone = tombstone});
    if (!ok) {
        throw compaction_exception(
          errc::key_limit_exceeded,
          fmt::format(
            "key index full with {} keys at offset {}",
            _index->size(),
            e.offset));
    }
    klog(
      cmplog.trace,
      "Indexed key {} at offset {}{}",
      *e.key,
      e.offset,
      tombstone ? " (tombstone)" : "");
    co_return ss::stop_iteration::no;
}

ss::future<ss::stop_iteration> rewrite_reducer::operator()(model::entry e) {
    if (_as) {
        _as->check();
    }
    ++_result.entries_read;
    if (!e.has_key()) {
        ++_result.unkeyed_dropped;
        co_return ss::stop_iteration::no;
    }
    auto record = co_await _index->get(*e.key);
    if (!record || record->offset != e.offset) {
        ++_result.superseded;
        co_return ss::stop_iteration::no;
    }
    if (record->tombstone) {
        ++_result.tombstones_dropped;
        co_return ss::stop_iteration::no;
    }
    const auto offset = e.offset;
    std::exception_ptr ex;
    try {
        co_await _writer->append(std::move(e));
    } catch (...) {
        ex = std::current_exception();
    }
    if (ex) {
        throw compaction_exception(
          errc::write_failure,
          fmt::format("failed to write offset {}: {}", offset, ex));
    }
    ++_result.entries_written;
    co_return ss::stop_iteration::no;
}

} // namespace compaction
