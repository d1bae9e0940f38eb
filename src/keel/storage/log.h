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
#include "bytes/bytes.h"
#include "model/entry_reader.h"
#include "model/fundamental.h"
#include "model/timestamp.h"
#include "storage/types.h"

#include <seastar/core/future.hh>
#include <seastar/core/sstring.hh>

#include <optional>

namespace storage {

/// Append-only, segmented sequence of entries for a single topic. Offsets are
/// assigned on append and are strictly increasing. The only mutation besides
/// appends is prefix truncation.
class log {
public:
    log() noexcept = default;
    log(const log&) = delete;
    log& operator=(const log&) = delete;
    log(log&&) noexcept = delete;
    log& operator=(log&&) noexcept = delete;
    virtual ~log() noexcept = default;

    virtual const model::topic& topic() const = 0;

    /// Appends an entry and returns the offset assigned to it. A present key
    /// with an empty payload is a tombstone.
    virtual ss::future<model::offset> append(
      std::optional<ss::sstring> key,
      bytes payload,
      model::timestamp ts = model::timestamp::now())
      = 0;

    /// Reader over the raw entries in the configured range. Raw logs do not
    /// serve the compacted view; requesting it is an std::invalid_argument.
    virtual ss::future<model::entry_reader> make_reader(log_reader_config) = 0;

    virtual offset_stats offsets() const = 0;

    /// Removes every segment that lies entirely below `o`. Readers created
    /// before the call fail when they reach a removed segment.
    virtual ss::future<> truncate_prefix(model::offset o) = 0;

    virtual size_t segment_count() const = 0;

    virtual log_stats stats() const = 0;

    virtual ss::future<> close() = 0;
};

} // namespace storage
