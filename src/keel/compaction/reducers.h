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
#include "compaction/compacted_log_writer.h"
#include "compaction/key_index.h"
#include "model/entry.h"
#include "model/fundamental.h"

#include <seastar/core/abort_source.hh>
#include <seastar/core/future.hh>

namespace compaction {

/// First pass: records the latest offset, and whether it is a tombstone, of
/// every key in the range. Unkeyed entries are skipped.
class index_builder_reducer {
public:
    struct result {
        size_t entries_read{0};
        size_t keyed_entries{0};
        model::offset last_offset;
    };

    explicit index_builder_reducer(
      key_index& index, ss::abort_source* as = nullptr)
      : _index(&index)
      , _as(as) {}

    ss::future<ss::stop_iteration> operator()(model::entry);
    result end_of_stream() { return _result; }

private:
    key_index* _index;
    ss::abort_source* _as;
    result _result;
};

/// Second pass: copies into the writer exactly those entries that won their
/// key in the first pass and are not tombstones.
class rewrite_reducer {
public:
    struct result {
        size_t entries_read{0};
        size_t entries_written{0};
        size_t superseded{0};
        size_t tombstones_dropped{0};
        size_t unkeyed_dropped{0};
    };

    rewrite_reducer(
      const key_index& index,
      compacted_log_writer& writer,
      ss::abort_source* as = nullptr)
      : _index(&index)
      , _writer(&writer)
      , _as(as) {}

    ss::future<ss::stop_iteration> operator()(model::entry);
    result end_of_stream() { return _result; }

private:
    const key_index* _index;
    compacted_log_writer* _writer;
    ss::abort_source* _as;
    result _result;
};

} // namespace compaction
