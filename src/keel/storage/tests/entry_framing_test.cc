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
#include "storage/entry_framing.h"
#include "storage/errc.h"
#include "storage/exceptions.h"

#include <fmt/format.h>
#include <gtest/gtest.h>

#include <cstdint>
#include <limits>
#include <string_view>

namespace {

model::entry sample(int64_t o, std::optional<ss::sstring> key, bytes payload) {
    return model::entry{
      .offset = model::offset(o),
      .key = std::move(key),
      .payload = std::move(payload),
      .timestamp = model::timestamp(1700000000000 + o),
    };
}

std::string_view view(const ss::temporary_buffer<char>& b) {
    return {b.get(), b.size()};
}

storage::errc decode_error(std::string_view buf) {
    try {
        storage::decode_frame(buf);
    } catch (const storage::storage_exception& e) {
        return static_cast<storage::errc>(e.code().value());
    }
    return storage::errc::success;
}

} // namespace

TEST(EntryFramingTest, FrameSize) {
    auto e = sample(7, "abc", bytes_from_string("hello"));
    auto buf = storage::encode_frame(e);
    EXPECT_EQ(buf.size(), storage::frame_overhead + 3 + 5);
}

TEST(EntryFramingTest, SizeFieldBoundsKeyAndPayload) {
    constexpr size_t max_frame = std::numeric_limits<int32_t>::max();
    constexpr size_t max_body = max_frame
                                - (storage::frame_overhead
                                   - storage::frame_size_field_size);
    EXPECT_TRUE(storage::fits_in_frame(0, 0));
    EXPECT_TRUE(storage::fits_in_frame(0, max_body));
    EXPECT_TRUE(storage::fits_in_frame(10, max_body - 10));
    EXPECT_FALSE(storage::fits_in_frame(0, max_body + 1));
    EXPECT_FALSE(storage::fits_in_frame(11, max_body - 10));
    EXPECT_FALSE(storage::fits_in_frame(max_body + 1, 0));
    // 2 GiB payloads wrap the int32 size field
    EXPECT_FALSE(storage::fits_in_frame(0, size_t(1) << 31U));
    EXPECT_FALSE(storage::fits_in_frame(
      std::numeric_limits<size_t>::max(), std::numeric_limits<size_t>::max()));
}

TEST(EntryFramingTest, KeyedUnkeyedAndTombstone) {
    for (auto& e :
         {sample(0, "a", model::encode_int32_value(1)),
          sample(1, std::nullopt, bytes_from_string("raw")),
          sample(2, "a", bytes{}),
          sample(3, ss::sstring(""), bytes_from_string("empty key"))}) {
        auto buf = storage::encode_frame(e);
        auto decoded = storage::decode_frame(view(buf));
        EXPECT_EQ(decoded.entry, e);
        EXPECT_EQ(decoded.frame_size, buf.size());
    }
}

TEST(EntryFramingTest, EmptyKeyIsNotAbsentKey) {
    auto buf = storage::encode_frame(sample(0, ss::sstring(""), bytes{}));
    auto decoded = storage::decode_frame(view(buf));
    ASSERT_TRUE(decoded.entry.has_key());
    EXPECT_TRUE(decoded.entry.is_tombstone());
}

TEST(EntryFramingTest, CrcMismatch) {
    auto buf = storage::encode_frame(
      sample(0, "key", bytes_from_string("payload")));
    buf.get_write()[buf.size() - 1] ^= 0x1;
    EXPECT_EQ(decode_error(view(buf)), storage::errc::corrupted_frame);
}

TEST(EntryFramingTest, Truncated) {
    auto buf = storage::encode_frame(
      sample(0, "key", bytes_from_string("payload")));
    EXPECT_EQ(
      decode_error(view(buf).substr(0, buf.size() - 2)),
      storage::errc::corrupted_frame);
    EXPECT_EQ(
      decode_error(view(buf).substr(0, 10)), storage::errc::corrupted_frame);
}

TEST(EntryFramingTest, ParserWalksConcatenatedFrames) {
    ss::sstring stream;
    for (int64_t i = 0; i < 4; ++i) {
        auto buf = storage::encode_frame(
          sample(
            i,
            ss::sstring(fmt::format("k{}", i)),
            model::encode_int32_value(static_cast<int32_t>(i))));
        stream.append(buf.get(), buf.size());
    }
    storage::frame_parser parser(std::string_view(stream.data(), stream.size()));
    int64_t expected = 0;
    while (!parser.end_of_stream()) {
        auto e = parser.next();
        EXPECT_EQ(e.offset, model::offset(expected));
        EXPECT_EQ(model::decode_int32_value(e), expected);
        ++expected;
    }
    EXPECT_EQ(expected, 4);
    EXPECT_EQ(parser.bytes_consumed(), stream.size());
}
