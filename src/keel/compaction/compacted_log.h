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
#include "model/fundamental.h"
#include "storage/segment.h"
#include "storage/types.h"

#include <seastar/core/future.hh>
#include <seastar/core/gate.hh>
#include <seastar/core/shared_ptr.hh>

#include <fmt/ostream.h>

#include <filesystem>
#include <iosfwd>
#include <optional>

namespace compaction {

/**
 * The deduplicated image of a topic's log below a snapshot boundary: at most
 * one entry per key, no tombstones, original offsets and timestamps.
 *
 * A compacted log is immutable once sealed. It is shared through
 * lw_shared_ptr<const compacted_log>; only reader tracking mutates it.
 */
class compacted_log final
  : public ss::enable_lw_shared_from_this<compacted_log> {
public:
    compacted_log(
      model::topic topic,
      model::offset boundary,
      ss::lw_shared_ptr<storage::segment> segment,
      std::optional<std::filesystem::path> file = std::nullopt);

    compacted_log(const compacted_log&) = delete;
    compacted_log& operator=(const compacted_log&) = delete;
    compacted_log(compacted_log&&) = delete;
    compacted_log& operator=(compacted_log&&) = delete;
    ~compacted_log() noexcept = default;

    const model::topic& topic() const { return _topic; }
    /// Exclusive upper bound of the raw offsets this log covers.
    model::offset boundary() const { return _boundary; }
    size_t entry_count() const { return _segment->entry_count(); }
    size_t size_bytes() const { return _segment->size_bytes(); }
    /// Backing file, when the log was persisted.
    const std::optional<std::filesystem::path>& file() const { return _file; }
    size_t active_readers() const { return _gate.get_count(); }
    bool is_retired() const { return _gate.is_closed(); }

    /**
     * Reader over the entries with offsets in [cfg.start_offset,
     * min(cfg.end_offset, boundary())). The reader keeps this log alive and
     * delays retire() until it is finished. Throws ss::gate_closed_exception
     * once the log is retired.
     */
    model::entry_reader make_reader(storage::log_reader_config cfg) const;

    /**
     * Waits for every reader to finish, then removes the backing file. Called
     * once the log has been superseded.
     */
    ss::future<> retire() const;

    friend std::ostream& operator<<(std::ostream&, const compacted_log&);

private:
    model::topic _topic;
    model::offset _boundary;
    ss::lw_shared_ptr<storage::segment> _segment;
    std::optional<std::filesystem::path> _file;
    mutable ss::gate _gate;
};

} // namespace compaction

template<>
struct fmt::formatter<compaction::compacted_log> : fmt::ostream_formatter {};
