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
#include "model/entry.h"
#include "model/entry_reader.h"
#include "storage/log.h"

#include <seastar/core/coroutine.hh>
#include <seastar/core/future.hh>
#include <seastar/util/noncopyable_function.hh>

#include <map>
#include <memory>
#include <optional>
#include <vector>

namespace compaction::testing {

using hook = ss::noncopyable_function<ss::future<>()>;

/// Delegates to a memory writer, running the given hooks first.
class hooked_writer final : public compacted_log_writer {
public:
    hooked_writer(
      std::unique_ptr<compacted_log_writer> inner, hook* on_append, hook* on_seal)
      : _inner(std::move(inner))
      , _on_append(on_append)
      , _on_seal(on_seal) {}

    ss::future<> append(model::entry e) final {
        if (_on_append && *_on_append) {
            co_await (*_on_append)();
        }
        co_await _inner->append(std::move(e));
    }

    ss::future<ss::lw_shared_ptr<const compacted_log>> seal() final {
        if (_on_seal && *_on_seal) {
            co_await (*_on_seal)();
        }
        co_return co_await _inner->seal();
    }

    ss::future<> abort() noexcept final {
        ++aborts;
        return _inner->abort();
    }

    size_t entries_written() const final { return _inner->entries_written(); }
    size_t bytes_written() const final { return _inner->bytes_written(); }

    static inline size_t aborts = 0;

private:
    std::unique_ptr<compacted_log_writer> _inner;
    hook* _on_append;
    hook* _on_seal;
};

inline writer_factory make_hooked_factory(hook* on_append, hook* on_seal) {
    return [on_append, on_seal](
             model::topic topic, model::offset boundary, uint64_t) {
        return ss::make_ready_future<std::unique_ptr<compacted_log_writer>>(
          std::make_unique<hooked_writer>(
            make_memory_writer(std::move(topic), boundary),
            on_append,
            on_seal));
    };
}

inline ss::future<model::offset>
put(storage::log& log, const char* key, int32_t value) {
    return log.append(ss::sstring(key), model::encode_int32_value(value));
}

inline ss::future<model::offset> remove(storage::log& log, const char* key) {
    return log.append(ss::sstring(key), bytes{});
}

inline ss::future<std::vector<model::entry>>
read_all(ss::future<model::entry_reader> reader_f) {
    auto reader = co_await std::move(reader_f);
    auto slice = co_await model::consume_reader_to_memory(
      std::move(reader), model::no_timeout);
    co_return std::vector<model::entry>(
      std::make_move_iterator(slice.begin()),
      std::make_move_iterator(slice.end()));
}

/// key -> decoded value of every keyed entry, later entries winning.
/// Tombstones map to std::nullopt.
inline std::map<ss::sstring, std::optional<int32_t>>
latest_values(const std::vector<model::entry>& entries) {
    std::map<ss::sstring, std::optional<int32_t>> ret;
    for (const auto& e : entries) {
        if (e.key) {
            ret[*e.key] = model::decode_int32_value(e);
        }
    }
    return ret;
}

/// Same as latest_values() but tombstones do not overwrite earlier values.
inline std::map<ss::sstring, int32_t>
latest_live_values(const std::vector<model::entry>& entries) {
    std::map<ss::sstring, int32_t> ret;
    for (const auto& e : entries) {
        if (e.key && !e.is_tombstone()) {
            ret[*e.key] = *model::decode_int32_value(e);
        }
    }
    return ret;
}

} // namespace compaction::testing
