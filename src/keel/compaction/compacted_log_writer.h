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
#include "compaction/compacted_log.h"
#include "model/entry.h"
#include "model/fundamental.h"

#include <seastar/core/future.hh>
#include <seastar/core/shared_ptr.hh>
#include <seastar/util/noncopyable_function.hh>

#include <cstdint>
#include <filesystem>
#include <memory>

namespace compaction {

/**
 * Sink for the second pass of a run. Entries are appended in increasing
 * offset order; seal() makes them immutable and durable and hands back the
 * finished log. A writer that is not sealed must be aborted, which discards
 * everything written so far.
 */
class compacted_log_writer {
public:
    compacted_log_writer() = default;
    compacted_log_writer(const compacted_log_writer&) = delete;
    compacted_log_writer& operator=(const compacted_log_writer&) = delete;
    compacted_log_writer(compacted_log_writer&&) = delete;
    compacted_log_writer& operator=(compacted_log_writer&&) = delete;
    virtual ~compacted_log_writer() = default;

    virtual ss::future<> append(model::entry) = 0;

    virtual ss::future<ss::lw_shared_ptr<const compacted_log>> seal() = 0;

    virtual ss::future<> abort() noexcept = 0;

    virtual size_t entries_written() const = 0;
    virtual size_t bytes_written() const = 0;
};

/// Opens the sink for a run. \p generation is the pointer version the run
/// publishes as, unique per topic.
using writer_factory = ss::noncopyable_function<
  ss::future<std::unique_ptr<compacted_log_writer>>(
    model::topic, model::offset boundary, uint64_t generation)>;

/// Keeps the compacted log in memory only.
std::unique_ptr<compacted_log_writer>
make_memory_writer(model::topic, model::offset boundary);

/**
 * Writes `<dir>/<topic>/compacted-<boundary>-<generation>.log.tmp` and
 * renames it to `compacted-<boundary>-<generation>.log` on seal. The entries
 * are also kept in memory to serve readers.
 *
 * Runs with the same boundary never share a file, so retiring the log a
 * rerun superseded leaves the new one in place.
 */
ss::future<std::unique_ptr<compacted_log_writer>> make_file_writer(
  std::filesystem::path dir,
  model::topic,
  model::offset boundary,
  uint64_t generation);

std::filesystem::path compacted_log_path(
  const std::filesystem::path& dir,
  const model::topic& topic,
  model::offset boundary,
  uint64_t generation);

writer_factory make_memory_writer_factory();
writer_factory make_file_writer_factory(std::filesystem::path dir);

} // namespace compaction
