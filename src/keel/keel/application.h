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
#include "compaction/service.h"
#include "compaction/types.h"
#include "model/entry.h"
#include "model/fundamental.h"
#include "storage/log_manager.h"

#include <seastar/core/app-template.hh>
#include <seastar/core/future.hh>
#include <seastar/util/log.hh>

#include <boost/program_options.hpp>

#include <memory>
#include <string_view>
#include <vector>

namespace po = boost::program_options; // NOLINT

/**
 * Demo driver: loads the configuration named by --keel-cfg, writes a small
 * set of int32 valued keys to one topic, and compacts it three times,
 * printing the compacted and raw views and the internal stats along the way.
 */
class application {
public:
    int run(int, char**);

    void initialize();
    void shutdown();

private:
    void validate_arguments(const po::variables_map&);
    void hydrate_config(const po::variables_map&);
    void run_scenario(const model::topic&);

    ss::future<> write_all(
      const model::topic&, const std::vector<ss::sstring>&, int32_t value);
    ss::future<>
    write_tombstones(const model::topic&, const std::vector<ss::sstring>&);
    ss::future<std::vector<model::entry>>
    read_view(const model::topic&, bool read_compacted);

    void print_view(
      std::string_view title, const std::vector<model::entry>& entries);
    void print_stats(const model::topic&);

    ss::app_template::config setup_app_config();

    ss::logger _log{"keel"};

    std::unique_ptr<storage::log_manager> _logs;
    std::unique_ptr<compaction::compaction_service> _compaction;
};
