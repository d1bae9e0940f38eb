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
#include "base/vlog.h"

#include <seastar/core/coroutine.hh>
#include <seastar/util/log.hh>
#include <seastar/util/tmp_file.hh>

#include <fmt/format.h>

#include <filesystem>

namespace details {
inline ss::logger tmpdir_logger("tmpdir-log");
}

/// Scratch directory for tests. Fixtures create it in SetUpAsync() and
/// remove it with its contents in TearDownAsync().
class temporary_dir {
public:
    ss::future<> create(const char* test_name) {
        auto path = std::filesystem::path(".")
                    / fmt::format("{}-XXXX", test_name);
        klog(
          details::tmpdir_logger.debug,
          "Creating temporary directory {}",
          path.native());
        _dir = co_await ss::make_tmp_dir(path);
    }

    ss::future<> remove() {
        if (!_dir.has_path()) {
            co_return;
        }
        klog(
          details::tmpdir_logger.debug,
          "Removing temporary directory {}",
          _dir.get_path().native());
        co_await _dir.remove();
    }

    std::filesystem::path get_path() const { return _dir.get_path(); }

private:
    ss::tmp_dir _dir;
};
