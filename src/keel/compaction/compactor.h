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
#include "compaction/compacted_log_pointer.h"
#include "compaction/compacted_log_writer.h"
#include "compaction/key_index.h"
#include "compaction/probe.h"
#include "compaction/types.h"
#include "model/entry_reader.h"
#include "model/fundamental.h"
#include "storage/log.h"
#include "storage/types.h"

#include <seastar/core/abort_source.hh>
#include <seastar/core/future.hh>
#include <seastar/core/gate.hh>
#include <seastar/core/shared_ptr.hh>

#include <memory>

namespace compaction {

/**
 * Compacts the log of a single topic and owns its compacted log pointer.
 *
 * A run captures the log's next offset as its snapshot boundary, indexes
 * [0, boundary) in a first pass, rewrites the winners of that index in a
 * second pass over the same range, and finally swaps the pointer to the
 * sealed result. Entries appended during a run are left for the next one.
 *
 * Offsets below the raw log's start offset are read from the published
 * compacted log, so keys that only lived in truncated segments carry over.
 * A run fails with errc::read_failure when truncation removed offsets that
 * no compacted log covers.
 *
 * Callers must not start a run while another is in progress; the
 * compaction::scheduler takes care of that.
 */
class compactor {
public:
    compactor(
      ss::shared_ptr<storage::log> log,
      compaction_config cfg,
      writer_factory make_writer);

    compactor(const compactor&) = delete;
    compactor& operator=(const compactor&) = delete;
    compactor(compactor&&) = delete;
    compactor& operator=(compactor&&) = delete;
    ~compactor() noexcept = default;

    /// Runs once. Fails with compaction_exception, leaving the pointer as it
    /// was, on any error.
    ss::future<run_stats> compact();

    /// Reader over the topic. With cfg.read_compacted the range below the
    /// published boundary is served from the compacted log.
    ss::future<model::entry_reader> make_reader(storage::log_reader_config cfg);

    compaction_state state() const { return _state; }
    compactor_stats stats() const;
    const compacted_log_pointer& pointer() const { return _pointer; }
    compacted_log_pointer& pointer() { return _pointer; }
    const ss::shared_ptr<storage::log>& log() const { return _log; }
    const compaction_config& config() const { return _config; }
    probe& get_probe() { return _probe; }

    /// Aborts a run in progress and waits for superseded logs to retire.
    ss::future<> stop();

private:
    ss::future<run_stats> do_compact();
    ss::future<std::unique_ptr<key_index>> make_index() const;
    storage::log_reader_config reader_config(model::offset, model::offset);
    ss::future<model::entry_reader> make_run_reader(
      const compacted_log_pointer::value_type& previous,
      model::offset split,
      model::offset boundary);
    void set_state(compaction_state);
    void retire_in_background(compacted_log_pointer::value_type);

    ss::shared_ptr<storage::log> _log;
    compaction_config _config;
    writer_factory _make_writer;
    compacted_log_pointer _pointer;
    compaction_state _state{compaction_state::idle};
    bool _running{false};
    compactor_stats _stats;
    probe _probe;
    ss::abort_source _as;
    ss::gate _gate;
};

} // namespace compaction
