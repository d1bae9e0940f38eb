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

#include "compaction/compacted_log.h"
#include "compaction/compacted_log_pointer.h"
#include "compaction/compacted_log_writer.h"
#include "compaction/tests/utils.h"
#include "storage/segment_file.h"
#include "test_utils/test.h"
#include "test_utils/tmp_dir.h"

#include <seastar/core/gate.hh>
#include <seastar/core/seastar.hh>
#include <seastar/core/sleep.hh>

#include <chrono>

using namespace std::chrono_literals;

namespace compaction {

namespace {

const model::topic topic("compacted-log-test");

model::entry keyed(int64_t o, const char* key, int32_t v) {
    return model::entry{
      .offset = model::offset(o),
      .key = ss::sstring(key),
      .payload = model::encode_int32_value(v),
      .timestamp = model::timestamp(o),
    };
}

ss::future<ss::lw_shared_ptr<const compacted_log>>
make_log(model::offset boundary, std::vector<model::entry> entries) {
    auto w = make_memory_writer(topic, boundary);
    for (auto& e : entries) {
        co_await w->append(std::move(e));
    }
    co_return co_await w->seal();
}

} // namespace

TEST_CORO(CompactedLogTest, ReaderIsBoundedByBoundary) {
    auto log = co_await make_log(
      model::offset(10), {keyed(2, "a", 1), keyed(5, "b", 1), keyed(9, "c", 1)});
    EXPECT_EQ(log->boundary(), model::offset(10));
    EXPECT_EQ(log->entry_count(), 3);
    EXPECT_FALSE(log->file().has_value());

    auto from_three = co_await testing::read_all(
      ss::make_ready_future<model::entry_reader>(
        log->make_reader(storage::log_reader_config(model::offset(3)))));
    ASSERT_EQ_CORO(from_three.size(), 2);
    EXPECT_EQ(from_three[0].offset, model::offset(5));

    auto ranged = co_await testing::read_all(
      ss::make_ready_future<model::entry_reader>(log->make_reader(
        storage::log_reader_config(model::offset(0), model::offset(9)))));
    EXPECT_EQ(ranged.size(), 2);
}

TEST_CORO(CompactedLogTest, EmptyLog) {
    auto log = co_await make_log(model::offset(0), {});
    EXPECT_EQ(log->entry_count(), 0);
    auto entries = co_await testing::read_all(
      ss::make_ready_future<model::entry_reader>(
        log->make_reader(storage::log_reader_config(model::offset(0)))));
    EXPECT_TRUE(entries.empty());
}

TEST_CORO(CompactedLogTest, RetireWaitsForReaders) {
    auto log = co_await make_log(model::offset(2), {keyed(0, "a", 1)});
    auto reader = log->make_reader(storage::log_reader_config(model::offset(0)));
    EXPECT_EQ(log->active_readers(), 1);

    auto retired = log->retire();
    co_await ss::sleep(10ms);
    EXPECT_FALSE(retired.available());
    EXPECT_TRUE(log->is_retired());

    // a retired log cannot hand out new readers
    EXPECT_THROW(
      log->make_reader(storage::log_reader_config(model::offset(0))),
      ss::gate_closed_exception);

    // readers that started before retirement finish normally
    auto entries = co_await model::consume_reader_to_memory(
      std::move(reader), model::no_timeout);
    EXPECT_EQ(entries.size(), 1);
    co_await std::move(retired);
    EXPECT_EQ(log->active_readers(), 0);
}

TEST_CORO(CompactedLogTest, ReaderKeepsLogAlive) {
    auto log = co_await make_log(model::offset(2), {keyed(1, "a", 7)});
    auto reader = log->make_reader(storage::log_reader_config(model::offset(0)));
    ss::lw_shared_ptr<const compacted_log> weak = log;
    log = nullptr;
    EXPECT_EQ(weak.use_count(), 2);
    weak = nullptr;
    auto entries = co_await model::consume_reader_to_memory(
      std::move(reader), model::no_timeout);
    ASSERT_EQ_CORO(entries.size(), 1);
    EXPECT_EQ(model::decode_int32_value(entries[0]), 7);
}

TEST(CompactedLogPointerTest, CompareAndSwap) {
    compacted_log_pointer p;
    EXPECT_EQ(p.get().get(), nullptr);
    EXPECT_EQ(p.boundary(), model::offset(0));
    EXPECT_EQ(p.version(), 0);

    auto first = make_log(model::offset(3), {}).get();
    auto second = make_log(model::offset(5), {}).get();

    EXPECT_TRUE(p.compare_and_swap(nullptr, first));
    EXPECT_EQ(p.boundary(), model::offset(3));
    EXPECT_EQ(p.version(), 1);

    // a publish that began before the first swap loses
    EXPECT_FALSE(p.compare_and_swap(nullptr, second));
    EXPECT_EQ(p.get().get(), first.get());
    EXPECT_EQ(p.version(), 1);

    EXPECT_TRUE(p.compare_and_swap(first, second));
    EXPECT_EQ(p.get().get(), second.get());
    EXPECT_EQ(p.boundary(), model::offset(5));
    EXPECT_EQ(p.version(), 2);
}

class FileWriterTest : public seastar_test {
public:
    ss::future<> SetUpAsync() override {
        return dir.create("compacted_log_file_writer_test");
    }
    ss::future<> TearDownAsync() override { return dir.remove(); }

    temporary_dir dir;
};

TEST_F_CORO(FileWriterTest, SealRenamesAndRetireRemoves) {
    const auto boundary = model::offset(8);
    auto path = compacted_log_path(dir.get_path(), topic, boundary, 2);
    auto tmp_path = fmt::format("{}.tmp", path.native());
    EXPECT_EQ(path.filename().native(), "compacted-8-2.log");
    EXPECT_EQ(path.parent_path().filename().native(), std::string(topic()));

    auto w = co_await make_file_writer(dir.get_path(), topic, boundary, 2);
    co_await w->append(keyed(1, "a", 1));
    co_await w->append(keyed(6, "b", 2));
    EXPECT_TRUE(co_await ss::file_exists(tmp_path));
    EXPECT_EQ(w->entries_written(), 2);
    EXPECT_GT(w->bytes_written(), 0);
    const auto written = w->bytes_written();

    auto log = co_await w->seal();
    EXPECT_FALSE(co_await ss::file_exists(tmp_path));
    EXPECT_TRUE(co_await ss::file_exists(path.native()));
    ASSERT_TRUE_CORO(log->file().has_value());
    EXPECT_EQ(*log->file(), path);
    EXPECT_EQ(log->size_bytes(), written);

    // the file holds the same frames the log serves
    auto loaded = co_await storage::read_segment_file(path, model::offset(0));
    auto on_disk = loaded->read(model::offset(0), model::offset::max(), 10);
    auto served = co_await testing::read_all(
      ss::make_ready_future<model::entry_reader>(
        log->make_reader(storage::log_reader_config(model::offset(0)))));
    ASSERT_EQ_CORO(on_disk.size(), served.size());
    for (size_t i = 0; i < served.size(); ++i) {
        EXPECT_EQ(on_disk[i], served[i]);
    }

    co_await log->retire();
    EXPECT_FALSE(co_await ss::file_exists(path.native()));
}

TEST_F_CORO(FileWriterTest, AbortRemovesTemporaryFile) {
    auto w = co_await make_file_writer(
      dir.get_path(), topic, model::offset(4), 1);
    co_await w->append(keyed(0, "a", 1));
    co_await w->abort();
    auto path = compacted_log_path(dir.get_path(), topic, model::offset(4), 1);
    EXPECT_FALSE(co_await ss::file_exists(fmt::format("{}.tmp", path.native())));
    EXPECT_FALSE(co_await ss::file_exists(path.native()));
}

} // namespace compaction
