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

#include "compaction/errc.h"
#include "compaction/exceptions.h"
#include "compaction/service.h"
#include "compaction/tests/utils.h"
#include "storage/log_manager.h"
#include "test_utils/test.h"

#include <seastar/core/when_all.hh>

#include <rapidjson/document.h>

#include <map>
#include <optional>

namespace compaction {

using testing::latest_values;
using testing::put;
using testing::read_all;
using testing::remove;

namespace {

const model::topic topic("service-test");

template<typename Func>
ss::future<std::error_code> error_of(Func f) {
    std::exception_ptr ex;
    try {
        co_await f();
    } catch (...) {
        ex = std::current_exception();
    }
    try {
        if (ex) {
            std::rethrow_exception(ex);
        }
    } catch (const compaction_exception& e) {
        co_return e.code();
    }
    co_return std::error_code{};
}

} // namespace

class CompactionServiceTest : public seastar_test {
public:
    ss::future<> TearDownAsync() override {
        co_await service.stop();
        co_await logs.stop();
    }

    storage::log_manager logs{storage::log_manager_config{
      .max_segment_entries = 2,
    }};
    compaction_service service{logs, compaction_config{}};
};

TEST_F_CORO(CompactionServiceTest, TopicNotFound) {
    const model::topic missing("missing");
    EXPECT_EQ(
      co_await error_of([&] { return service.compact(missing); }),
      errc::topic_not_found);
    EXPECT_EQ(
      co_await error_of([&] {
          return service
            .make_reader(missing, storage::log_reader_config(model::offset(0)))
            .discard_result();
      }),
      errc::topic_not_found);
    EXPECT_THROW(service.internal_stats(missing), compaction_exception);
    EXPECT_EQ(service.get_compactor(missing), nullptr);
}

TEST_F_CORO(CompactionServiceTest, RawViewBeforeFirstRun) {
    auto log = co_await logs.manage(topic);
    co_await put(*log, "a", 1);
    co_await remove(*log, "a");
    storage::log_reader_config cfg(model::offset(0));
    cfg.read_compacted = true;
    auto entries = co_await read_all(service.make_reader(topic, cfg));
    EXPECT_EQ(entries.size(), 2);
    EXPECT_EQ(service.get_compactor(topic), nullptr);
}

TEST_F_CORO(CompactionServiceTest, CompactAndRead) {
    auto log = co_await logs.manage(topic);
    co_await put(*log, "a", 1);
    co_await put(*log, "b", 1);
    co_await put(*log, "a", 2);
    co_await remove(*log, "b");
    co_await service.compact(topic);

    storage::log_reader_config cfg(model::offset(0));
    cfg.read_compacted = true;
    auto compacted = co_await read_all(service.make_reader(topic, cfg));
    EXPECT_EQ(
      latest_values(compacted),
      (std::map<ss::sstring, std::optional<int32_t>>{{"a", 2}}));

    cfg.read_compacted = false;
    EXPECT_EQ((co_await read_all(service.make_reader(topic, cfg))).size(), 4);
}

TEST_F_CORO(CompactionServiceTest, ConcurrentRunsAreSerialized) {
    auto log = co_await logs.manage(topic);
    for (int i = 0; i < 10; ++i) {
        co_await put(*log, i % 2 == 0 ? "a" : "b", i);
    }
    co_await ss::when_all_succeed(
      service.compact(topic), service.compact(topic), service.compact(topic));
    auto* c = service.get_compactor(topic);
    ASSERT_TRUE_CORO(c != nullptr);
    EXPECT_EQ(c->stats().runs_succeeded, 3);
    EXPECT_EQ(c->pointer().version(), 3);
}

TEST_F_CORO(CompactionServiceTest, InternalStatsJson) {
    auto log = co_await logs.manage(topic);
    for (auto k : {"a", "b", "c", "x1", "x2"}) {
        co_await put(*log, k, 1);
    }
    auto before = service.internal_stats(topic);
    EXPECT_EQ(before.log.entry_count, 5);
    EXPECT_EQ(before.log.segment_count, 3);
    EXPECT_FALSE(before.compacted.has_value());

    co_await service.compact(topic);
    auto after = service.internal_stats(topic);
    ASSERT_TRUE_CORO(after.compacted.has_value());
    EXPECT_EQ(after.compacted->boundary, model::offset(5));
    EXPECT_EQ(after.compacted->entry_count, 5);
    EXPECT_EQ(after.pointer_version, 1);

    auto json = to_json(after);
    rapidjson::Document doc;
    doc.Parse(json.data(), json.size());
    ASSERT_FALSE_CORO(doc.HasParseError());
    EXPECT_STREQ(doc["topic"].GetString(), "service-test");
    EXPECT_EQ(doc["log"]["segment_count"].GetUint64(), 3);
    EXPECT_EQ(doc["log"]["entry_count"].GetUint64(), 5);
    EXPECT_EQ(doc["log"]["offsets"]["next_offset"].GetInt64(), 5);
    EXPECT_STREQ(doc["compactor"]["state"].GetString(), "idle");
    EXPECT_EQ(doc["compactor"]["runs_succeeded"].GetUint64(), 1);
    EXPECT_TRUE(doc["compactor"]["last_error"].IsNull());
    EXPECT_EQ(doc["compactor"]["last_run"]["entries_written"].GetUint64(), 5);
    EXPECT_EQ(doc["compacted_log"]["boundary"].GetInt64(), 5);
    EXPECT_TRUE(doc["compacted_log"]["file"].IsNull());
    EXPECT_EQ(doc["pointer_version"].GetUint64(), 1);
}

TEST_F_CORO(CompactionServiceTest, StatsJsonBeforeFirstRun) {
    co_await logs.manage(topic);
    auto json = to_json(service.internal_stats(topic));
    rapidjson::Document doc;
    doc.Parse(json.data(), json.size());
    ASSERT_FALSE_CORO(doc.HasParseError());
    EXPECT_TRUE(doc["compacted_log"].IsNull());
    EXPECT_EQ(doc["log"]["entry_count"].GetUint64(), 0);
    EXPECT_TRUE(doc["log"]["offsets"]["dirty_offset"].IsNull());
    EXPECT_EQ(doc["log"]["offsets"]["start_offset"].GetInt64(), 0);
    EXPECT_EQ(doc["log"]["offsets"]["next_offset"].GetInt64(), 0);
}

TEST_F_CORO(CompactionServiceTest, CompactedKeysSurvivePrefixTruncation) {
    auto log = co_await logs.manage(topic);
    co_await put(*log, "a", 1);
    co_await put(*log, "b", 1);
    co_await put(*log, "c", 1);
    co_await service.compact(topic);
    // drops the segment holding a and b, both covered by the compacted log
    co_await log->truncate_prefix(model::offset(2));
    co_await put(*log, "c", 2);
    co_await service.compact(topic);

    storage::log_reader_config cfg(model::offset(0));
    cfg.read_compacted = true;
    auto compacted = co_await read_all(service.make_reader(topic, cfg));
    using values = std::map<ss::sstring, std::optional<int32_t>>;
    EXPECT_EQ(latest_values(compacted), (values{{"a", 1}, {"b", 1}, {"c", 2}}));
    ASSERT_EQ_CORO(compacted.size(), 3);
    EXPECT_EQ(compacted[0].offset, model::offset(0));
    EXPECT_EQ(compacted[1].offset, model::offset(1));
    EXPECT_EQ(compacted[2].offset, model::offset(3));

    // the next run reads them from the compacted log again
    co_await service.compact(topic);
    compacted = co_await read_all(service.make_reader(topic, cfg));
    EXPECT_EQ(latest_values(compacted), (values{{"a", 1}, {"b", 1}, {"c", 2}}));

    auto stats = service.internal_stats(topic);
    EXPECT_EQ(stats.compactor.runs_failed, 0);
    EXPECT_EQ(stats.compactor.state, compaction_state::idle);
    EXPECT_EQ(stats.log.offsets.start_offset, model::offset(2));
}

TEST_F_CORO(CompactionServiceTest, TruncatedBeforeCompactionIsReadFailure) {
    auto log = co_await logs.manage(topic);
    co_await put(*log, "a", 1);
    co_await service.compact(topic);
    co_await put(*log, "b", 1);
    co_await put(*log, "c", 1);
    // offset 1 (b) was never compacted
    co_await log->truncate_prefix(model::offset(2));
    EXPECT_EQ(
      co_await error_of([&] { return service.compact(topic); }),
      errc::read_failure);

    storage::log_reader_config cfg(model::offset(0));
    cfg.read_compacted = true;
    auto compacted = co_await read_all(service.make_reader(topic, cfg));
    using values = std::map<ss::sstring, std::optional<int32_t>>;
    EXPECT_EQ(latest_values(compacted), (values{{"a", 1}, {"c", 1}}));
    auto stats = service.internal_stats(topic);
    EXPECT_EQ(stats.compactor.runs_failed, 1);
    EXPECT_EQ(stats.compactor.state, compaction_state::failed);
    ASSERT_TRUE_CORO(stats.compacted.has_value());
    EXPECT_EQ(stats.compacted->boundary, model::offset(1));
}

} // namespace compaction
