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

#include "base/likely.h"
#include "base/seastarx.h"
#include "model/entry.h"
#include "model/timeout_clock.h"

#include <seastar/core/circular_buffer.hh>
#include <seastar/core/do_with.hh>
#include <seastar/core/future.hh>
#include <seastar/core/loop.hh>
#include <seastar/util/bool_class.hh>

#include <fmt/ostream.h>

#include <memory>
#include <vector>

namespace model {

template<typename Consumer>
concept EntryReaderConsumer = requires(Consumer c, entry&& e) {
    { c(std::move(e)) } -> std::same_as<ss::future<ss::stop_iteration>>;
    c.end_of_stream();
};

/// Lazy, forward only cursor over entries in strictly increasing offset
/// order. Implementations load entries a slice at a time.
class entry_reader final {
public:
    using data_t = ss::circular_buffer<model::entry>;

    class impl {
    public:
        impl() noexcept = default;
        impl(impl&& o) noexcept = default;
        impl& operator=(impl&& o) noexcept = default;
        impl(const impl& o) = delete;
        impl& operator=(const impl& o) = delete;
        virtual ~impl() noexcept = default;

        virtual bool is_end_of_stream() const = 0;

        virtual ss::future<data_t> do_load_slice(timeout_clock::time_point)
          = 0;

        virtual void print(std::ostream&) = 0;

        bool is_slice_empty() const { return _slice.empty(); }

        /// Called once the reader is done being consumed, regardless of
        /// the outcome. Releases whatever the implementation holds on to.
        virtual ss::future<> finally() noexcept { return ss::now(); }

        template<typename Consumer>
        auto consume(Consumer consumer, timeout_clock::time_point timeout) {
            return ss::do_with(
              std::move(consumer), [this, timeout](Consumer& consumer) {
                  return do_consume(consumer, timeout);
              });
        }

    private:
        entry pop_entry() {
            entry e = std::move(_slice.front());
            _slice.pop_front();
            return e;
        }

        ss::future<> load_slice(timeout_clock::time_point timeout) {
            return do_load_slice(timeout).then(
              [this](data_t s) { _slice = std::move(s); });
        }

        template<typename Consumer>
        auto do_consume(Consumer& consumer, timeout_clock::time_point timeout) {
            return ss::repeat([this, timeout, &consumer] {
                       if (likely(!is_slice_empty())) {
                           return consumer(pop_entry());
                       }
                       if (is_end_of_stream()) {
                           return ss::make_ready_future<ss::stop_iteration>(
                             ss::stop_iteration::yes);
                       }
                       return load_slice(timeout).then(
                         [] { return ss::stop_iteration::no; });
                   })
              .then([&consumer] { return consumer.end_of_stream(); });
        }

        data_t _slice;
    };

public:
    explicit entry_reader(std::unique_ptr<impl> impl) noexcept
      : _impl(std::move(impl)) {}
    entry_reader(const entry_reader&) = delete;
    entry_reader& operator=(const entry_reader&) = delete;
    entry_reader(entry_reader&&) noexcept = default;
    entry_reader& operator=(entry_reader&&) noexcept = default;
    ~entry_reader() noexcept = default;

    bool is_end_of_stream() const {
        return _impl->is_slice_empty() && _impl->is_end_of_stream();
    }

    // Stops when consumer returns stop_iteration::yes or end of stream is
    // reached. The next call resumes from the following entry.
    template<typename Consumer>
    requires EntryReaderConsumer<Consumer>
    auto consume(Consumer consumer, timeout_clock::time_point timeout) & {
        return _impl->consume(std::move(consumer), timeout);
    }

    /**
     * Consumes a reader that is about to go out of scope:
     *
     *    return std::move(reader).consume(index_builder(...), timeout);
     *
     * The impl is kept alive until the consume future resolves and its
     * finally() has run.
     */
    template<typename Consumer>
    requires EntryReaderConsumer<Consumer>
    auto consume(Consumer consumer, timeout_clock::time_point timeout) && {
        // ss::shared_ptr cannot adopt an abstract impl, so the raw pointer
        // travels alongside the owning unique_ptr.
        auto raw = _impl.get();
        return raw->consume(std::move(consumer), timeout)
          .finally([raw, i = std::move(_impl)]() mutable {
              return raw->finally().finally([i = std::move(i)] {});
          });
    }

    std::unique_ptr<impl> release() && { return std::move(_impl); }

    friend std::ostream& operator<<(std::ostream& os, const entry_reader& r) {
        r._impl->print(os);
        return os;
    }

private:
    std::unique_ptr<impl> _impl;
};

template<typename Impl, typename... Args>
entry_reader make_entry_reader(Args&&... args) {
    return entry_reader(std::make_unique<Impl>(std::forward<Args>(args)...));
}

entry_reader make_memory_entry_reader(entry_reader::data_t);

entry_reader make_empty_entry_reader();

/// Reads each of `readers` to completion, in order. Callers are
/// responsible for the readers covering disjoint, increasing offset ranges.
entry_reader make_concatenating_entry_reader(std::vector<entry_reader>);

ss::future<entry_reader::data_t>
consume_reader_to_memory(entry_reader, timeout_clock::time_point timeout);

} // namespace model

template<>
struct fmt::formatter<model::entry_reader> : fmt::ostream_formatter {};
