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

#include "compaction/compacted_log.h"

#include "base/vlog.h"
#include "compaction/logger.h"
#include "storage/segment_reader.h"

#include <seastar/core/coroutine.hh>
#include <seastar/core/seastar.hh>

#include <fmt/format.h>

#include <algorithm>

namespace compaction {

namespace {

class compacted_log_reader final : public model::entry_reader::impl {
    using data_t = model::entry_reader::data_t;

public:
    compacted_log_reader(
      ss::lw_shared_ptr<const compacted_log> log,
      ss::gate::holder holder,
      model::entry_reader inner) noexcept
      : _log(std::move(log))
      , _holder(std::move(holder))
      , _inner(std::move(inner).release()) {}

    bool is_end_of_stream() const final { return _inner->is_end_of_stream(); }

    ss::future<data_t> do_load_slice(model::timeout_clock::time_point t) final {
        return _inner->do_load_slice(t);
    }

    void print(std::ostream& os) final {
        fmt::print(os, "compacted log reader {}: ", *_log);
        _inner->print(os);
    }

    ss::future<> finally() noexcept final {
        co_await _inner->finally();
        _holder.release();
    }

private:
    ss::lw_shared_ptr<const compacted_log> _log;
    ss::gate::holder _holder;
    std::unique_ptr<model::entry_reader::impl> _inner;
};

} // namespace

compacted_log::compacted_log(
  model::topic topic,
  model::offset boundary,
  ss::lw_shared_ptr<storage::segment> segment,
  std::optional<std::filesystem::path> file)
  : _topic(std::move(topic))
  , _boundary(boundary)
  , _segment(std::move(segment))
  , _file(std::move(file)) {}

model::entry_reader
compacted_log::make_reader(storage::log_reader_config cfg) const {
    auto holder = _gate.hold();
    cfg.end_offset = std::min(cfg.end_offset, _boundary);
    storage::segment_reader::segment_set set;
    if (!_segment->empty()) {
        set.push_back(_segment);
    }
    return model::make_entry_reader<compacted_log_reader>(
      shared_from_this(),
      std::move(holder),
      model::make_entry_reader<storage::segment_reader>(
        std::move(set), std::move(cfg)));
}

ss::future<> compacted_log::retire() const {
    klog(
      cmplog.debug,
      "[{}] Retiring compacted log at boundary {}, waiting on {} readers",
      _topic,
      _boundary,
      _gate.get_count());
    co_await _gate.close();
    if (_file) {
        klog(cmplog.debug, "[{}] Removing {}", _topic, _file->native());
        co_await ss::remove_file(_file->native());
    }
}

std::ostream& operator<<(std::ostream& o, const compacted_log& l) {
    fmt::print(
      o,
      "{{topic: {}, boundary: {}, entries: {}, size_bytes: {}, file: {}, "
      "readers: {}}}",
      l._topic,
      l._boundary,
      l.entry_count(),
      l.size_bytes(),
      l._file ? l._file->native() : std::string("<memory>"),
      l._gate.get_count());
    return o;
}

} // namespace compaction
