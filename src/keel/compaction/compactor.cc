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

#include "compaction/compactor.h"

#include "base/vassert.h"
#include "base/vlog.h"
#include "compaction/compacted_reader.h"
#include "compaction/errc.h"
#include "compaction/exceptions.h"
#include "compaction/logger.h"
#include "compaction/reducers.h"
#include "model/entry_reader.h"
#include "model/timeout_clock.h"
#include "ssx/future-util.h"
#include "storage/exceptions.h"

#include <seastar/core/coroutine.hh>
#include <seastar/core/lowres_clock.hh>
#include <seastar/util/defer.hh>

#include <fmt/format.h>

#include <chrono>
#include <exception>
#include <vector>

namespace compaction {

namespace {

/// Maps whatever a run failed with onto compaction::errc. Failures are
/// attributed to the phase the run was in when they surfaced.
std::exception_ptr
translate_failure(std::exception_ptr ex, compaction_state phase) {
    auto wrap = [](errc ec, std::string_view what) {
        return std::make_exception_ptr(
          compaction_exception(ec, ss::sstring(what)));
    };
    const auto fallback = phase == compaction_state::scanning_phase_one
                            ? errc::read_failure
                            : errc::write_failure;
    try {
        std::rethrow_exception(ex);
    } catch (const compaction_exception&) {
        return ex;
    } catch (const storage::storage_exception& e) {
        return wrap(errc::read_failure, e.what());
    } catch (const ss::abort_requested_exception& e) {
        return wrap(errc::aborted, e.what());
    } catch (const ss::gate_closed_exception& e) {
        return wrap(errc::aborted, e.what());
    } catch (const std::exception& e) {
        return wrap(fallback, e.what());
    } catch (...) {
        return wrap(fallback, "unknown exception");
    }
}

} // namespace

compactor::compactor(
  ss::shared_ptr<storage::log> log,
  compaction_config cfg,
  writer_factory make_writer)
  : _log(std::move(log))
  , _config(std::move(cfg))
  , _make_writer(std::move(make_writer)) {}

void compactor::set_state(compaction_state s) {
    klog(
      cmplog.debug,
      "[{}] Compactor state {} -> {}",
      _log->topic(),
      _state,
      s);
    _state = s;
}

storage::log_reader_config
compactor::reader_config(model::offset start, model::offset end) {
    storage::log_reader_config cfg(start, end, _as);
    cfg.max_entries_per_slice = _config.read_slice_entries;
    return cfg;
}

ss::future<model::entry_reader> compactor::make_run_reader(
  const compacted_log_pointer::value_type& previous,
  model::offset split,
  model::offset boundary) {
    const auto start = _log->offsets().start_offset;
    if (start > split) {
        throw compaction_exception(
          errc::read_failure,
          fmt::format(
            "{} truncated to {} while compacting, offsets below it are lost",
            _log->topic(),
            start));
    }
    if (split == model::offset{0}) {
        co_return co_await _log->make_reader(reader_config(split, boundary));
    }
    kassert(
      previous && previous->boundary() >= split,
      "Compacting {} from {} without a compacted log covering it",
      _log->topic(),
      split);
    std::vector<model::entry_reader> readers;
    readers.push_back(
      previous->make_reader(reader_config(model::offset{0}, split)));
    readers.push_back(
      co_await _log->make_reader(reader_config(split, boundary)));
    co_return model::make_concatenating_entry_reader(std::move(readers));
}

ss::future<std::unique_ptr<key_index>> compactor::make_index() const {
    if (_config.max_keys == 0) {
        co_return std::make_unique<simple_key_index>();
    }
    auto index = std::make_unique<hash_key_index>();
    co_await index->initialize(_config.max_keys);
    co_return index;
}

ss::future<run_stats> compactor::compact() {
    auto holder = _gate.hold();
    kassert(
      !_running,
      "Concurrent compaction of {}, runs must be serialized by the scheduler",
      _log->topic());
    _running = true;
    auto reset = ss::defer([this] { _running = false; });
    co_return co_await do_compact();
}

ss::future<run_stats> compactor::do_compact() {
    const auto start = ss::lowres_clock::now();
    const auto& topic = _log->topic();
    // a run only ever publishes over the log that was current when it began
    const auto expected = _pointer.get();
    const auto expected_version = _pointer.version();
    const auto boundary = _log->offsets().next_offset;
    kassert(
      boundary >= _pointer.boundary(),
      "Snapshot boundary {} of {} below published boundary {}",
      boundary,
      topic,
      _pointer.boundary());

    _probe.run_started();
    klog(
      cmplog.info,
      "[{}] Starting compaction below offset {}",
      topic,
      boundary);

    run_stats stats{.boundary = boundary};
    std::unique_ptr<compacted_log_writer> writer;
    std::exception_ptr ex;
    try {
        set_state(compaction_state::scanning_phase_one);
        // offsets below the raw log's start offset survive only in the
        // published compacted log, both passes read them from there
        const auto split = _log->offsets().start_offset;
        const auto covered = expected ? expected->boundary() : model::offset{0};
        if (split > covered) {
            throw compaction_exception(
              errc::read_failure,
              fmt::format(
                "{} offsets [{}, {}) were truncated before being compacted",
                topic,
                covered,
                split));
        }
        auto index = co_await make_index();
        auto phase_one = co_await make_run_reader(expected, split, boundary);
        auto indexed = co_await std::move(phase_one).consume(
          index_builder_reducer(*index, &_as), model::no_timeout);
        stats.entries_read = indexed.entries_read;
        stats.keys_indexed = index->size();
        stats.tombstones = index->tombstones();
        klog(
          cmplog.debug,
          "[{}] Indexed {} keys ({} tombstones) from {} entries",
          topic,
          stats.keys_indexed,
          stats.tombstones,
          stats.entries_read);

        set_state(compaction_state::scanning_phase_two);
        writer = co_await _make_writer(topic, boundary, expected_version + 1);
        auto phase_two = co_await make_run_reader(expected, split, boundary);
        auto rewritten = co_await std::move(phase_two).consume(
          rewrite_reducer(*index, *writer, &_as), model::no_timeout);
        stats.entries_written = rewritten.entries_written;
        stats.bytes_written = writer->bytes_written();
        klog(
          cmplog.debug,
          "[{}] Rewrote {} entries, dropped {} superseded, {} tombstones, {} "
          "unkeyed",
          topic,
          rewritten.entries_written,
          rewritten.superseded,
          rewritten.tombstones_dropped,
          rewritten.unkeyed_dropped);

        set_state(compaction_state::publishing);
        _as.check();
        auto sealed = co_await writer->seal();
        writer.reset();
        if (!_pointer.compare_and_swap(expected, sealed)) {
            _probe.pointer_swap_failed();
            // never published, so no reader can hold it
            retire_in_background(std::move(sealed));
            throw compaction_exception(
              errc::pointer_swap_failure,
              fmt::format(
                "compacted log of {} changed while compacting below {}",
                topic,
                boundary));
        }
        klog(cmplog.info, "[{}] Published compacted log {}", topic, *sealed);
    } catch (...) {
        ex = std::current_exception();
    }

    if (ex) {
        if (writer) {
            co_await writer->abort();
        }
        auto failed_in = _state;
        set_state(compaction_state::failed);
        _probe.run_failed();
        ex = translate_failure(ex, failed_in);
        klog(
          cmplog.warn,
          "[{}] Compaction below offset {} failed in {}: {}",
          topic,
          boundary,
          failed_in,
          ex);
        _stats.last_error = ss::sstring(fmt::format("{}", ex));
        std::rethrow_exception(ex);
    }

    if (expected) {
        retire_in_background(expected);
    }
    stats.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
      ss::lowres_clock::now() - start);
    _probe.run_succeeded(stats.entries_read, stats.entries_written);
    _stats.last_run = stats;
    _stats.last_error = std::nullopt;
    set_state(compaction_state::idle);
    co_return stats;
}

void compactor::retire_in_background(compacted_log_pointer::value_type log) {
    ssx::spawn_with_gate(_gate, [this, log = std::move(log)] {
        return log->retire()
          .then([this] { _probe.log_retired(); })
          .handle_exception([this, log](std::exception_ptr e) {
              klog(
                cmplog.warn,
                "[{}] Failed to retire compacted log {}: {}",
                _log->topic(),
                *log,
                e);
          });
    });
}

ss::future<model::entry_reader>
compactor::make_reader(storage::log_reader_config cfg) {
    auto holder = _gate.hold();
    co_return co_await make_compacted_reader(*_log, _pointer, std::move(cfg));
}

compactor_stats compactor::stats() const {
    auto s = _stats;
    s.state = _state;
    s.runs_started = _probe.runs_started();
    s.runs_succeeded = _probe.runs_succeeded();
    s.runs_failed = _probe.runs_failed();
    return s;
}

ss::future<> compactor::stop() {
    klog(cmplog.debug, "[{}] Stopping compactor", _log->topic());
    _as.request_abort();
    co_await _gate.close();
    _probe.clear_metrics();
}

} // namespace compaction
