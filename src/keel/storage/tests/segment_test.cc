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

#include "storage/entry_framing.h"
#include "storage/errc.h"
#include "storage/exceptions.h"
#include "storage/segment.h"

#include <gtest/gtest.h>

namespace {

model::entry keyed(int64_t o, const char* key) {
    return model::entry{
      .offset = model::offset(o),
      .key = ss::sstring(key),
      .payload = model::encode_int32_value(static_cast<int32_t>(o)),
      .timestamp = model::timestamp(o),
    };
}

} // namespace

TEST(SegmentTest, ReadRange) {
    storage::segment seg(model::offset(10));
    for (int64_t o = 10; o < 15; ++o) {
        seg.append(keyed(o, "k"));
    }
    EXPECT_EQ(seg.entry_count(), 5);
    EXPECT_EQ(seg.last_offset(), model::offset(14));

    auto all = seg.read(model::offset(0), model::offset::max(), 100);
    ASSERT_EQ(all.size(), 5);

    auto mid = seg.read(model::offset(11), model::offset(13), 100);
    ASSERT_EQ(mid.size(), 2);
    EXPECT_EQ(mid.front().offset, model::offset(11));
    EXPECT_EQ(mid.back().offset, model::offset(12));

    auto capped = seg.read(model::offset(10), model::offset::max(), 3);
    EXPECT_EQ(capped.size(), 3);
}

TEST(SegmentTest, SparseOffsets) {
    storage::segment seg(model::offset(0));
    seg.append(keyed(1, "a"));
    seg.append(keyed(4, "b"));
    seg.append(keyed(9, "c"));
    auto r = seg.read(model::offset(2), model::offset(9), 10);
    ASSERT_EQ(r.size(), 1);
    EXPECT_EQ(r.front().offset, model::offset(4));
}

TEST(SegmentTest, ClosedSegmentFailsReads) {
    storage::segment seg(model::offset(0));
    seg.append(keyed(0, "a"));
    seg.close();
    EXPECT_TRUE(seg.is_closed());
    try {
        seg.read(model::offset(0), model::offset::max(), 10);
        FAIL() << "read from a closed segment succeeded";
    } catch (const storage::storage_exception& e) {
        EXPECT_EQ(e.code(), storage::errc::read_failure);
    }
}

TEST(SegmentTest, FromBuffer) {
    ss::sstring raw;
    for (int64_t o = 3; o < 6; ++o) {
        auto f = storage::encode_frame(keyed(o, "x"));
        raw.append(f.get(), f.size());
    }
    auto seg = storage::segment::from_buffer(
      model::offset(3), ss::temporary_buffer<char>(raw.data(), raw.size()));
    EXPECT_EQ(seg.entry_count(), 3);
    EXPECT_EQ(seg.size_bytes(), raw.size());
    auto r = seg.read(model::offset(0), model::offset::max(), 10);
    ASSERT_EQ(r.size(), 3);
    EXPECT_EQ(r[2], keyed(5, "x"));
}
