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

#include <seastar/core/coroutine.hh>
#include <seastar/core/thread.hh>
#include <seastar/testing/test_runner.hh>

#include <gtest/gtest.h>

/*
 * Fixture base for tests whose bodies are coroutines. gtest_main.cc runs
 * every test inside a seastar thread, so the synchronous gtest hooks can
 * wait on futures.
 */
class seastar_test : public ::testing::Test {
public:
    virtual seastar::future<> SetUpAsync() {
        return seastar::make_ready_future<>();
    }
    virtual seastar::future<> TearDownAsync() {
        return seastar::make_ready_future<>();
    }

private:
    void SetUp() override { SetUpAsync().get(); }
    void TearDown() override { TearDownAsync().get(); }
};

// NOLINTBEGIN(cppcoreguidelines-macro-usage,bugprone-macro-parentheses)
#define GTEST_TEST_SEASTAR_(                                                     test_suite_name, test_name, parent_class, parent_id)                             static_assert(                                                                   std::is_base_of_v<seastar_test, parent_class>, "wrong base");                class GTEST_TEST_CLASS_NAME_(test_suite_name, test_name)                         : public parent_class {                                                      public:                                                                            GTEST_TEST_CLASS_NAME_(test_suite_name, test_name)() = default;                ~GTEST_TEST_CLASS_NAME_(test_suite_name, test_name)() override                   = default;                                                                   GTEST_TEST_CLASS_NAME_(test_suite_name, test_name)                             (const GTEST_TEST_CLASS_NAME_(test_suite_name, test_name) &) = delete;         GTEST_TEST_CLASS_NAME_(test_suite_name, test_name) &                           operator=(const GTEST_TEST_CLASS_NAME_(test_suite_name, test_name) &)            = delete; /* NOLINT */                                                                                                                                  private:                                                                           void TestBody() override { TestBodyWrapped().get(); }                          seastar::future<> TestBodyWrapped();                                           static ::testing::TestInfo* const test_info_ [[maybe_unused]];             };                                                                                                                                                            ::testing::TestInfo* const GTEST_TEST_CLASS_NAME_(                               test_suite_name, test_name)::test_info_                                        = ::testing::internal::MakeAndRegisterTestInfo(                                  #test_suite_name,                                                              #test_name,                                                                    nullptr,                                                                       nullptr,                                                                       ::testing::internal::CodeLocation(__FILE__, __LINE__),                         (parent_id),                                                                   ::testing::internal::SuiteApiResolver<                                           parent_class>::GetSetUpCaseOrSuite(__FILE__, __LINE__),                      ::testing::internal::SuiteApiResolver<                                           parent_class>::GetTearDownCaseOrSuite(__FILE__, __LINE__),                   new ::testing::internal::TestFactoryImpl<GTEST_TEST_CLASS_NAME_(                 test_suite_name, test_name)>);                                           seastar::future<> GTEST_TEST_CLASS_NAME_(                                        test_suite_name, test_name)::TestBodyWrapped()

#define TEST_CORO(test_suite_name, test_name)                                      GTEST_TEST_SEASTAR_(                                                             test_suite_name,                                                               test_name,                                                                     seastar_test,                                                                  ::testing::internal::GetTestTypeId())

#define TEST_F_CORO(test_fixture, test_name)                                       GTEST_TEST_SEASTAR_(                                                             test_fixture,                                                                  test_name,                                                                     test_fixture,                                                                  ::testing::internal::GetTypeId<test_fixture>())

/*
 * Fatal assertions usable from coroutine bodies, where a plain return is
 * not allowed.
 */
#define GTEST_FATAL_FAILURE_CORO_(message)                                         co_return GTEST_MESSAGE_(message, ::testing::TestPartResult::kFatalFailure)
#define ASSERT_PRED_FORMAT2_CORO(pred_format, v1, v2)                              GTEST_PRED_FORMAT2_(pred_format, v1, v2, GTEST_FATAL_FAILURE_CORO_)

#define ASSERT_TRUE_CORO(condition)                                                GTEST_TEST_BOOLEAN_(                                                             condition, #condition, false, true, GTEST_FATAL_FAILURE_CORO_)
#define ASSERT_FALSE_CORO(condition)                                               GTEST_TEST_BOOLEAN_(                                                             !(condition), #condition, true, false, GTEST_FATAL_FAILURE_CORO_)
#define ASSERT_EQ_CORO(val1, val2)                                                 ASSERT_PRED_FORMAT2_CORO(::testing::internal::EqHelper::Compare, val1, val2)
#define ASSERT_NE_CORO(val1, val2)                                                 ASSERT_PRED_FORMAT2_CORO(::testing::internal::CmpHelperNE, val1, val2)
#define ASSERT_GT_CORO(val1, val2)                                                 ASSERT_PRED_FORMAT2_CORO(::testing::internal::CmpHelperGT, val1, val2)
#define ASSERT_GE_CORO(val1, val2)                                                 ASSERT_PRED_FORMAT2_CORO(::testing::internal::CmpHelperGE, val1, val2)
#define ASSERT_LT_CORO(val1, val2)                                                 ASSERT_PRED_FORMAT2_CORO(::testing::internal::CmpHelperLT, val1, val2)
#define ASSERT_THROW_CORO(statement, expected_exception)                           GTEST_TEST_THROW_(statement, expected_exception, GTEST_FATAL_FAILURE_CORO_)
#define ASSERT_NO_THROW_CORO(statement)                                            GTEST_TEST_NO_THROW_(statement, GTEST_FATAL_FAILURE_CORO_)
// NOLINTEND(cppcoreguidelines-macro-usage,bugprone-macro-parentheses)
