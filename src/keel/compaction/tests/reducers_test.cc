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
#include "compaction/errc.h"
#include "compaction/exceptions.h"
#include "compaction/key_index.h"
#include "compaction/reducers.h"
#include "compaction/tests/utils.h"
#include "test_utils/test.h"

#include <seastar/core/abort_source.hh>

namespace compaction {

namespace {

model::entry
make(int64_t o, std::optional<ss::sstring> key, std::optional<int32_t> v) {
    return model::entry{
      .offset = model::offset(o),
      .key = std::move(key),
      .payload = v ? model::encode_int32_value(*v) : bytes{},
      .timestamp = model::timestamp(1000 + o),
    };
}

// a=1 b=1 <unkeyed> a=2 b=<tombstone> c=3
model::entry_reader::data_t sample_entries() {
    model::entry_reader::data_t ret;
    ret.push_back(make(0, "a", 1));
    ret.push_back(make(1, "b", 1));
    ret.push_back(make(2, std::nullopt, 9));
    ret.push_back(make(3, "a", 2));
    ret.push_back(make(4, "b", std::nullopt));
    ret.push_back(make(5, "c", 3));
    return ret;
}

} // namespace

TEST_CORO(IndexBuilderTest, IndexesLatestOffsets) {
    simple_key_index index;
    auto res = co_await model::make_memory_entry_reader(sample_entries())
                 .consume(index_builder_reducer(index), model::no_timeout);
    EXPECT_EQ(res.entries_read, 6);
    EXPECT_EQ(res.keyed_entries, 5);
    EXPECT_EQ(res.last_offset, model::offset(5));
    EXPECT_EQ(index.size(), 3);
    EXPECT_EQ(index.tombstones(), 1);
    EXPECT_EQ((co_await index.get("a"))->offset, model::offset(3));
    EXPECT_TRUE((co_await index.get("b"))->tombstone);
    EXPECT_EQ((co_await index.get("c"))->offset, model::offset(5));
}

TEST_CORO(IndexBuilderTest, KeyLimit) {
    simple_key_index index(2);
    try {
        co_await model::make_memory_entry_reader(sample_entries())
          .consume(index_builder_reducer(index), model::no_timeout);
        ADD_FAILURE() << "index accepted more keys than its capacity";
    } catch (const compaction_exception& e) {
        EXPECT_EQ(e.code(), errc::key_limit_exceeded);
    }
}

TEST_CORO(IndexBuilderTest, Aborted) {
    simple_key_index index;
    ss::abort_source as;
    as.request_abort();
    ASSERT_THROW_CORO(
      co_await model::make_memory_entry_reader(sample_entries())
        .consume(index_builder_reducer(index, &as), model::no_timeout),
      ss::abort_requested_exception);
    EXPECT_EQ(index.size(), 0);
}

TEST_CORO(RewriteTest, KeepsWinnersOnly) {
    simple_key_index index;
    co_await model::make_memory_entry_reader(sample_entries())
      .consume(index_builder_reducer(index), model::no_timeout);

    auto writer = make_memory_writer(model::topic("t"), model::offset(6));
    auto res = co_await model::make_memory_entry_reader(sample_entries())
                 .consume(rewrite_reducer(index, *writer), model::no_timeout);
    EXPECT_EQ(res.entries_read, 6);
    EXPECT_EQ(res.entries_written, 2);
    // a@0 and b@1
    EXPECT_EQ(res.superseded, 2);
    EXPECT_EQ(res.tombstones_dropped, 1);
    EXPECT_EQ(res.unkeyed_dropped, 1);
    EXPECT_EQ(writer->entries_written(), 2);

    auto log = co_await writer->seal();
    auto entries = co_await testing::read_all(
      ss::make_ready_future<model::entry_reader>(
        log->make_reader(storage::log_reader_config(model::offset(0)))));
    ASSERT_EQ_CORO(entries.size(), 2);
    EXPECT_EQ(entries[0], make(3, "a", 2));
    EXPECT_EQ(entries[1], make(5, "c", 3));
}

TEST_CORO(RewriteTest, WriterFailure) {
    simple_key_index index;
    co_await model::make_memory_entry_reader(sample_entries())
      .consume(index_builder_reducer(index), model::no_timeout);

    testing::hook fail = []() -> ss::future<> {
        return ss::make_exception_future<>(std::runtime_error("disk full"));
    };
    testing::hooked_writer writer(
      make_memory_writer(model::topic("t"), model::offset(6)), &fail, nullptr);
    try {
        co_await model::make_memory_entry_reader(sample_entries())
          .consume(rewrite_reducer(index, writer), model::no_timeout);
        ADD_FAILURE() << "rewrite succeeded with a failing writer";
    } catch (const compaction_exception& e) {
        EXPECT_EQ(e.code(), errc::write_failure);
    }
    co_await writer.abort();
}

} // namespace compaction
