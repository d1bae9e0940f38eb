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

#include "model/entry_reader.h"

#include <seastar/core/coroutine.hh>

#include <fmt/format.h>

#include <utility>

namespace model {
using data_t = entry_reader::data_t;

entry_reader make_memory_entry_reader(data_t entries) {
    class reader final : public entry_reader::impl {
    public:
        explicit reader(data_t entries)
          : _entries(std::move(entries)) {}

        bool is_end_of_stream() const final { return _entries.empty(); }

        void print(std::ostream& os) final {
            fmt::print(os, "memory reader {} entries", _entries.size());
        }

        ss::future<data_t> do_load_slice(timeout_clock::time_point) final {
            return ss::make_ready_future<data_t>(std::exchange(_entries, {}));
        }

    private:
        data_t _entries;
    };

    return make_entry_reader<reader>(std::move(entries));
}

entry_reader make_empty_entry_reader() {
    return make_memory_entry_reader(data_t{});
}

entry_reader make_concatenating_entry_reader(std::vector<entry_reader> rdrs) {
    class reader final : public entry_reader::impl {
    public:
        explicit reader(std::vector<entry_reader> readers) {
            _readers.reserve(readers.size());
            for (auto& r : readers) {
                _readers.push_back(std::move(r).release());
            }
        }

        bool is_end_of_stream() const final {
            return _current >= _readers.size();
        }

        void print(std::ostream& os) final {
            fmt::print(
              os,
              "concatenating reader {}/{} [",
              _current,
              _readers.size());
            for (auto& r : _readers) {
                r->print(os);
                os << ";";
            }
            os << "]";
        }

        ss::future<data_t>
        do_load_slice(timeout_clock::time_point timeout) final {
            while (_current < _readers.size()) {
                auto& r = _readers[_current];
                if (!r->is_end_of_stream()) {
                    auto slice = co_await r->do_load_slice(timeout);
                    if (!slice.empty()) {
                        co_return slice;
                    }
                    continue;
                }
                co_await r->finally();
                ++_current;
            }
            co_return data_t{};
        }

        ss::future<> finally() noexcept final {
            for (; _current < _readers.size(); ++_current) {
                co_await _readers[_current]->finally();
            }
        }

    private:
        std::vector<std::unique_ptr<entry_reader::impl>> _readers;
        size_t _current{0};
    };

    return make_entry_reader<reader>(std::move(rdrs));
}

ss::future<data_t> consume_reader_to_memory(
  entry_reader reader, timeout_clock::time_point timeout) {
    class memory_entry_consumer {
    public:
        ss::future<ss::stop_iteration> operator()(model::entry e) {
            _result.push_back(std::move(e));
            return ss::make_ready_future<ss::stop_iteration>(
              ss::stop_iteration::no);
        }
        data_t end_of_stream() { return std::move(_result); }

    private:
        data_t _result;
    };
    return std::move(reader).consume(memory_entry_consumer{}, timeout);
}

} // namespace model
