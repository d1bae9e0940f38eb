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
#include "hashing/secure.h"
#include "model/fundamental.h"

#include <seastar/core/future.hh>
#include <seastar/core/sstring.hh>

#include <absl/container/btree_map.h>

#include <optional>
#include <vector>

namespace compaction {

/// The latest entry seen for a key.
struct key_record {
    model::offset offset;
    bool tombstone{false};

    bool operator==(const key_record&) const = default;
};

/**
 * Map from key to the latest record written for it. Built by the first pass
 * of a run and read, immutably, by the second.
 */
class key_index {
public:
    key_index() = default;
    key_index(const key_index&) = delete;
    key_index& operator=(const key_index&) = delete;
    key_index(key_index&&) noexcept = default;
    key_index& operator=(key_index&&) noexcept = default;
    virtual ~key_index() = default;

    /**
     * Associate \p record with \p key, replacing the existing record when
     * \p record has an equal or higher offset. Resolves to false when the key
     * is new and the index is full.
     */
    virtual ss::future<bool> put(const ss::sstring& key, key_record record)
      = 0;

    virtual ss::future<std::optional<key_record>>
    get(const ss::sstring& key) const = 0;

    /**
     * Return the highest inserted offset.
     */
    virtual model::offset max_offset() const = 0;

    /**
     * Return the number of keys in the index.
     */
    virtual size_t size() const = 0;

    /**
     * Return the number of keys whose latest record is a tombstone.
     */
    virtual size_t tombstones() const = 0;

    /**
     * Return the number of keys the index can hold.
     */
    virtual size_t capacity() const = 0;
};

/**
 * Stores every key in full. Unbounded unless \p max_keys is given.
 */
class simple_key_index final : public key_index {
public:
    explicit simple_key_index(std::optional<size_t> max_keys = std::nullopt);

    ss::future<bool> put(const ss::sstring& key, key_record record) final;

    ss::future<std::optional<key_record>>
    get(const ss::sstring& key) const final;

    model::offset max_offset() const final { return _max_offset; }
    size_t size() const final { return _map.size(); }
    size_t tombstones() const final { return _tombstones; }
    size_t capacity() const final { return _max_keys; }

private:
    absl::btree_map<ss::sstring, key_record> _map;
    model::offset _max_offset;
    size_t _tombstones{0};
    size_t _max_keys;
};

/**
 * A key_index in which the key space is mapped to sha256(key), with a fixed
 * capacity chosen up front. Memory use does not depend on key length.
 *
 * A default constructed instance has zero capacity, call initialize() first.
 */
class hash_key_index final : public key_index {
    static constexpr double max_load_factor = 0.95;

public:
    ss::future<bool> put(const ss::sstring& key, key_record record) final;

    ss::future<std::optional<key_record>>
    get(const ss::sstring& key) const final;

    model::offset max_offset() const final { return _max_offset; }
    size_t size() const final { return _size; }
    size_t tombstones() const final { return _tombstones; }
    size_t capacity() const final { return _capacity; }

    /**
     * Size the table to hold \p max_keys keys. Destroys existing contents.
     */
    ss::future<> initialize(size_t max_keys);

    /**
     * The ratio of searches (one get or put) to table slots inspected.
     */
    double hit_rate() const;

private:
    using hash_type = hash_sha256;

    struct slot {
        hash_type::digest_type digest{};
        key_record record;
        bool empty() const { return digest == hash_type::digest_type{}; }
    };

    /**
     * Successive 32 bit chunks of the digest are used as probes into the
     * table. Once they run out the caller switches to linear probing.
     */
    struct probe {
        using index_type = uint32_t;
        static_assert(sizeof(index_type) <= hash_type::digest_size);

        explicit probe(const hash_type::digest_type&);

        std::optional<index_type> next();

        hash_type::digest_type::const_pointer iter;
        hash_type::digest_type::const_pointer end;
    };

    /// Returns the slot holding \p digest, or the empty slot where it
    /// belongs, or nullptr when the table has neither.
    slot* find_slot(const hash_type::digest_type& digest) const;

    hash_type::digest_type hash_key(const ss::sstring&) const;

    mutable hash_type _hasher;
    mutable std::vector<slot> _slots;

    size_t _size{0};
    size_t _tombstones{0};
    size_t _capacity{0};
    model::offset _max_offset;
    mutable size_t _search_count{0};
    mutable size_t _probe_count{0};
};

} // namespace compaction
