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

#include "compaction/compacted_log_writer.h"

#include "base/vlog.h"
#include "compaction/logger.h"
#include "storage/entry_framing.h"
#include "storage/segment.h"

#include <seastar/core/coroutine.hh>
#include <seastar/core/file.hh>
#include <seastar/core/fstream.hh>
#include <seastar/core/iostream.hh>
#include <seastar/core/seastar.hh>

#include <fmt/format.h>

#include <exception>

namespace compaction {

namespace {

class memory_writer final : public compacted_log_writer {
public:
    memory_writer(model::topic topic, model::offset boundary)
      : _topic(std::move(topic))
      , _boundary(boundary)
      , _segment(ss::make_lw_shared<storage::segment>(model::offset{0})) {}

    ss::future<> append(model::entry e) final {
        _segment->append(e);
        ++_entries;
        return ss::now();
    }

    ss::future<ss::lw_shared_ptr<const compacted_log>> seal() final {
        _segment->seal();
        return ss::make_ready_future<ss::lw_shared_ptr<const compacted_log>>(
          ss::make_lw_shared<compacted_log>(
            _topic, _boundary, std::exchange(_segment, nullptr)));
    }

    ss::future<> abort() noexcept final {
        _segment = nullptr;
        return ss::now();
    }

    size_t entries_written() const final { return _entries; }
    size_t bytes_written() const final {
        return _segment ? _segment->size_bytes() : 0;
    }

private:
    model::topic _topic;
    model::offset _boundary;
    ss::lw_shared_ptr<storage::segment> _segment;
    size_t _entries{0};
};

class file_writer final : public compacted_log_writer {
public:
    file_writer(
      model::topic topic,
      model::offset boundary,
      std::filesystem::path path,
      ss::output_stream<char> out)
      : _topic(std::move(topic))
      , _boundary(boundary)
      , _path(std::move(path))
      , _tmp_path(fmt::format("{}.tmp", _path.native()))
      , _out(std::move(out))
      , _segment(ss::make_lw_shared<storage::segment>(model::offset{0})) {}

    ss::future<> append(model::entry e) final {
        auto frame = storage::encode_frame(e);
        _bytes += frame.size();
        ++_entries;
        co_await _out.write(frame.get(), frame.size());
        _segment->append_frame(e.offset, std::move(frame));
    }

    ss::future<ss::lw_shared_ptr<const compacted_log>> seal() final {
        co_await _out.flush();
        _closed = true;
        co_await _out.close();
        co_await ss::rename_file(_tmp_path.native(), _path.native());
        co_await ss::sync_directory(_path.parent_path().native());
        _segment->seal();
        klog(
          cmplog.debug,
          "[{}] Sealed {} with {} entries",
          _topic,
          _path.native(),
          _entries);
        co_return ss::make_lw_shared<compacted_log>(
          _topic, _boundary, std::exchange(_segment, nullptr), _path);
    }

    ss::future<> abort() noexcept final {
        _segment = nullptr;
        if (!_closed) {
            _closed = true;
            try {
                co_await _out.close();
            } catch (...) {
                klog(
                  cmplog.warn,
                  "[{}] Error closing {} on abort: {}",
                  _topic,
                  _tmp_path.native(),
                  std::current_exception());
            }
        }
        try {
            if (co_await ss::file_exists(_tmp_path.native())) {
                co_await ss::remove_file(_tmp_path.native());
            }
        } catch (...) {
            klog(
              cmplog.warn,
              "[{}] Error removing {} on abort: {}",
              _topic,
              _tmp_path.native(),
              std::current_exception());
        }
    }

    size_t entries_written() const final { return _entries; }
    size_t bytes_written() const final { return _bytes; }

private:
    model::topic _topic;
    model::offset _boundary;
    std::filesystem::path _path;
    std::filesystem::path _tmp_path;
    ss::output_stream<char> _out;
    ss::lw_shared_ptr<storage::segment> _segment;
    size_t _entries{0};
    size_t _bytes{0};
    bool _closed{false};
};

} // namespace

std::unique_ptr<compacted_log_writer>
make_memory_writer(model::topic topic, model::offset boundary) {
    return std::make_unique<memory_writer>(std::move(topic), boundary);
}

std::filesystem::path compacted_log_path(
  const std::filesystem::path& dir,
  const model::topic& topic,
  model::offset boundary,
  uint64_t generation) {
    return dir / std::string(topic())
           / fmt::format("compacted-{}-{}.log", boundary, generation);
}

ss::future<std::unique_ptr<compacted_log_writer>> make_file_writer(
  std::filesystem::path dir,
  model::topic topic,
  model::offset boundary,
  uint64_t generation) {
    auto path = compacted_log_path(dir, topic, boundary, generation);
    co_await ss::recursive_touch_directory(path.parent_path().native());
    auto tmp = fmt::format("{}.tmp", path.native());
    auto f = co_await ss::open_file_dma(
      tmp,
      ss::open_flags::create | ss::open_flags::truncate | ss::open_flags::rw);
    auto out = co_await ss::make_file_output_stream(std::move(f));
    klog(cmplog.trace, "[{}] Writing compacted log to {}", topic, tmp);
    co_return std::make_unique<file_writer>(
      std::move(topic), boundary, std::move(path), std::move(out));
}

writer_factory make_memory_writer_factory() {
    return [](model::topic topic, model::offset boundary, uint64_t) {
        return ss::make_ready_future<std::unique_ptr<compacted_log_writer>>(
          make_memory_writer(std::move(topic), boundary));
    };
}

writer_factory make_file_writer_factory(std::filesystem::path dir) {
    return [dir = std::move(dir)](
             model::topic topic, model::offset boundary, uint64_t generation) {
        return make_file_writer(dir, std::move(topic), boundary, generation);
    };
}

} // namespace compaction
