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
#include "test_utils/test.h"

#include <fmt/format.h>

namespace compaction {

namespace {

key_record live(int64_t o) {
    return key_record{.offset = model::offset(o), .tombstone = false};
}

key_record tombstone(int64_t o) {
    return key_record{.offset = model::offset(o), .tombstone = true};
}

ss::future<> check_last_write_wins(key_index& index) {
    EXPECT_TRUE(co_await index.put("a", live(0)));
    EXPECT_TRUE(co_await index.put("b", live(1)));
    EXPECT_TRUE(co_await index.put("a", live(2)));
    EXPECT_EQ(index.size(), 2);
    EXPECT_EQ(co_await index.get("a"), live(2));
    EXPECT_EQ(co_await index.get("b"), live(1));
    EXPECT_EQ(co_await index.get("c"), std::nullopt);
    EXPECT_EQ(index.max_offset(), model::offset(2));
}

ss::future<> check_tombstones(key_index& index) {
    co_await index.put("a", live(0));
    co_await index.put("a", tombstone(1));
    co_await index.put("b", tombstone(2));
    EXPECT_EQ(index.tombstones(), 2);
    co_await index.put("b", live(3));
    EXPECT_EQ(index.tombstones(), 1);
    EXPECT_EQ(co_await index.get("a"), tombstone(1));
    EXPECT_EQ(co_await index.get("b"), live(3));
}

ss::future<> check_older_offset_ignored(key_index& index) {
    co_await index.put("a", live(5));
    EXPECT_TRUE(co_await index.put("a", tombstone(3)));
    EXPECT_EQ(co_await index.get("a"), live(5));
    EXPECT_EQ(index.tombstones(), 0);
}

ss::future<> check_capacity(key_index& index) {
    // index holds 2 keys
    EXPECT_TRUE(co_await index.put("a", live(0)));
    EXPECT_TRUE(co_await index.put("b", live(1)));
    EXPECT_FALSE(co_await index.put("c", live(2)));
    // existing keys can still be rewritten
    EXPECT_TRUE(co_await index.put("a", live(3)));
    EXPECT_EQ(index.size(), 2);
    EXPECT_EQ(co_await index.get("c"), std::nullopt);
}

} // namespace

TEST_CORO(SimpleKeyIndexTest, LastWriteWins) {
    simple_key_index index;
    co_await check_last_write_wins(index);
}

TEST_CORO(SimpleKeyIndexTest, Tombstones) {
    simple_key_index index;
    co_await check_tombstones(index);
}

TEST_CORO(SimpleKeyIndexTest, OlderOffsetIgnored) {
    simple_key_index index;
    co_await check_older_offset_ignored(index);
}

TEST_CORO(SimpleKeyIndexTest, Capacity) {
    simple_key_index index(2);
    EXPECT_EQ(index.capacity(), 2);
    co_await check_capacity(index);
}

TEST_CORO(HashKeyIndexTest, Uninitialized) {
    hash_key_index index;
    EXPECT_EQ(index.capacity(), 0);
    EXPECT_FALSE(co_await index.put("a", live(0)));
    EXPECT_EQ(co_await index.get("a"), std::nullopt);
}

TEST_CORO(HashKeyIndexTest, LastWriteWins) {
    hash_key_index index;
    co_await index.initialize(16);
    co_await check_last_write_wins(index);
}

TEST_CORO(HashKeyIndexTest, Tombstones) {
    hash_key_index index;
    co_await index.initialize(16);
    co_await check_tombstones(index);
}

TEST_CORO(HashKeyIndexTest, OlderOffsetIgnored) {
    hash_key_index index;
    co_await index.initialize(16);
    co_await check_older_offset_ignored(index);
}

TEST_CORO(HashKeyIndexTest, Capacity) {
    hash_key_index index;
    co_await index.initialize(2);
    EXPECT_EQ(index.capacity(), 2);
    co_await check_capacity(index);
}

TEST_CORO(HashKeyIndexTest, FullTable) {
    constexpr size_t keys = 2000;
    hash_key_index index;
    co_await index.initialize(keys);
    for (size_t i = 0; i < keys; ++i) {
        ASSERT_TRUE_CORO(co_await index.put(
          ss::sstring(fmt::format("key-{}", i)),
          live(static_cast<int64_t>(i))));
    }
    EXPECT_EQ(index.size(), keys);
    EXPECT_FALSE(co_await index.put("one-too-many", live(keys)));
    for (size_t i = 0; i < keys; ++i) {
        auto r = co_await index.get(ss::sstring(fmt::format("key-{}", i)));
        ASSERT_TRUE_CORO(r.has_value());
        EXPECT_EQ(r->offset, model::offset(static_cast<int64_t>(i)));
    }
    EXPECT_GT(index.hit_rate(), 0.0);
    EXPECT_LE(index.hit_rate(), 1.0);
}

TEST_CORO(HashKeyIndexTest, InitializeResets) {
    hash_key_index index;
    co_await index.initialize(4);
    co_await index.put("a", tombstone(7));
    co_await index.initialize(4);
    EXPECT_EQ(index.size(), 0);
    EXPECT_EQ(index.tombstones(), 0);
    EXPECT_EQ(index.max_offset(), model::offset{});
    EXPECT_EQ(co_await index.get("a"), std::nullopt);
}

} // namespace compaction
