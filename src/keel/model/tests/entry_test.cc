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

#include "model/entry.h"
#include "model/fundamental.h"

#include <gtest/gtest.h>

#include <stdexcept>

namespace {

model::entry make_entry(
  int64_t o, std::optional<ss::sstring> key, bytes payload = bytes{}) {
    return model::entry{
      .offset = model::offset(o),
      .key = std::move(key),
      .payload = std::move(payload),
      .timestamp = model::timestamp(o),
    };
}

} // namespace

TEST(EntryTest, TombstoneRequiresKey) {
    auto keyed = make_entry(0, "a");
    EXPECT_TRUE(keyed.has_key());
    EXPECT_TRUE(keyed.is_tombstone());
    EXPECT_FALSE(keyed.value().has_value());

    auto unkeyed = make_entry(1, std::nullopt);
    EXPECT_FALSE(unkeyed.has_key());
    EXPECT_FALSE(unkeyed.is_tombstone());
    ASSERT_TRUE(unkeyed.value().has_value());
    EXPECT_TRUE(unkeyed.value()->empty());
}

TEST(EntryTest, ValueOfLiveEntry) {
    auto e = make_entry(3, "k", bytes_from_string("hello"));
    EXPECT_FALSE(e.is_tombstone());
    ASSERT_TRUE(e.value().has_value());
    EXPECT_EQ(e.value()->size(), 5);
    EXPECT_EQ(e.size_bytes(), 6);
}

TEST(EntryTest, Int32ValueIsBigEndian) {
    auto b = model::encode_int32_value(0x01020304);
    ASSERT_EQ(b.size(), 4);
    EXPECT_EQ(b[0], 0x01);
    EXPECT_EQ(b[3], 0x04);

    auto e = make_entry(0, "x1", model::encode_int32_value(-7));
    EXPECT_EQ(model::decode_int32_value(e), -7);
}

TEST(EntryTest, Int32ValueOfTombstone) {
    EXPECT_EQ(model::decode_int32_value(make_entry(0, "x1")), std::nullopt);
}

TEST(EntryTest, Int32ValueWrongWidth) {
    auto e = make_entry(0, "x1", bytes_from_string("abc"));
    EXPECT_THROW(model::decode_int32_value(e), std::invalid_argument);
}

TEST(EntryTest, OffsetArithmetic) {
    EXPECT_EQ(model::next_offset(model::offset{}), model::offset(0));
    EXPECT_EQ(model::next_offset(model::offset(4)), model::offset(5));
    EXPECT_EQ(model::prev_offset(model::offset(0)), model::offset{});
    EXPECT_EQ(model::prev_offset(model::offset(5)), model::offset(4));
}

TEST(EntryTest, Print) {
    auto e = make_entry(2, "a", bytes_from_string("v"));
    auto s = fmt::format("{}", e);
    EXPECT_NE(s.find("offset: 2"), std::string::npos);
    EXPECT_NE(s.find("key: a"), std::string::npos);
}
