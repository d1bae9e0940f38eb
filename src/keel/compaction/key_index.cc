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

#include "compaction/key_index.h"

#include <seastar/core/coroutine.hh>
#include <seastar/core/preempt.hh>
#include <seastar/coroutine/maybe_yield.hh>

#include <cstring>
#include <limits>

namespace compaction {

simple_key_index::simple_key_index(std::optional<size_t> max_keys)
  : _max_keys(max_keys.value_or(std::numeric_limits<size_t>::max())) {}

ss::future<bool>
simple_key_index::put(const ss::sstring& key, key_record record) {
    auto it = _map.find(key);
    if (it == _map.end()) {
        if (_map.size() >= _max_keys) {
            return ss::make_ready_future<bool>(false);
        }
        _map.emplace(key, record);
        _tombstones += record.tombstone ? 1 : 0;
    } else if (record.offset >= it->second.offset) {
        _tombstones -= it->second.tombstone ? 1 : 0;
        _tombstones += record.tombstone ? 1 : 0;
        it->second = record;
    }
    _max_offset = std::max(_max_offset, record.offset);
    return ss::make_ready_future<bool>(true);
}

ss::future<std::optional<key_record>>
simple_key_index::get(const ss::sstring& key) const {
    auto it = _map.find(key);
    if (it == _map.end()) {
        return ss::make_ready_future<std::optional<key_record>>(std::nullopt);
    }
    return ss::make_ready_future<std::optional<key_record>>(it->second);
}

hash_key_index::slot*
hash_key_index::find_slot(const hash_type::digest_type& digest) const {
    if (_slots.empty()) {
        return nullptr;
    }
    ++_search_count;

    auto check = [&](size_t index) -> slot* {
        ++_probe_count;
        auto& s = _slots[index % _slots.size()];
        if (s.empty() || s.digest == digest) {
            return &s;
        }
        return nullptr;
    };

    probe p(digest);
    std::optional<probe::index_type> last;
    while (auto index = p.next()) {
        if (auto* s = check(*index)) {
            return s;
        }
        last = index;
    }

    // fall back to linear probe
    const size_t linear_base = last.value_or(0);
    for (size_t i = 0; i < _slots.size(); ++i) {
        if (auto* s = check(linear_base + i)) {
            return s;
        }
    }
    return nullptr;
}

ss::future<bool>
hash_key_index::put(const ss::sstring& key, key_record record) {
    const auto digest = hash_key(key);
    auto* s = find_slot(digest);
    if (s == nullptr) {
        co_return false;
    }
    if (s->empty()) {
        if (_size >= _capacity) {
            co_return false;
        }
        s->digest = digest;
        s->record = record;
        ++_size;
        _tombstones += record.tombstone ? 1 : 0;
    } else if (record.offset >= s->record.offset) {
        _tombstones -= s->record.tombstone ? 1 : 0;
        _tombstones += record.tombstone ? 1 : 0;
        s->record = record;
    }
    _max_offset = std::max(_max_offset, record.offset);
    co_return true;
}

ss::future<std::optional<key_record>>
hash_key_index::get(const ss::sstring& key) const {
    const auto digest = hash_key(key);
    auto* s = find_slot(digest);
    if (s == nullptr || s->empty()) {
        co_return std::nullopt;
    }
    co_return s->record;
}

ss::future<> hash_key_index::initialize(size_t max_keys) {
    _slots.clear();
    _slots.shrink_to_fit();
    const auto slots = static_cast<size_t>(
      static_cast<double>(max_keys) / max_load_factor);
    _slots.reserve(slots + 1);
    while (_slots.size() <= slots) {
        _slots.emplace_back();
        if (ss::need_preempt()) {
            co_await ss::coroutine::maybe_yield();
        }
    }
    _capacity = max_keys;
    _size = 0;
    _tombstones = 0;
    _max_offset = model::offset{};
    _search_count = 0;
    _probe_count = 0;
}

double hash_key_index::hit_rate() const {
    if (_probe_count == 0) {
        return 1.0;
    }
    return static_cast<double>(_search_count)
           / static_cast<double>(_probe_count);
}

hash_key_index::probe::probe(const hash_type::digest_type& hash)
  : iter(hash.data())
  , end(iter + hash_type::digest_size) {}

std::optional<hash_key_index::probe::index_type> hash_key_index::probe::next() {
    if ((iter + sizeof(index_type)) > end) {
        return std::nullopt;
    }
    // NOLINTNEXTLINE(cppcoreguidelines-init-variables)
    index_type index;
    std::memcpy(&index, iter, sizeof(index_type));
    iter += sizeof(index_type);
    return index;
}

hash_key_index::hash_type::digest_type
hash_key_index::hash_key(const ss::sstring& key) const {
    try {
        _hasher.update(std::string_view(key.data(), key.size()));
        return _hasher.reset();
    } catch (...) {
        _hasher.reset();
        throw;
    }
}

} // namespace compaction
