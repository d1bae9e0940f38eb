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

#include "keel/application.h"

#include "base/vlog.h"
#include "compaction/errc.h"
#include "compaction/exceptions.h"
#include "config/configuration.h"
#include "model/entry_reader.h"
#include "storage/types.h"

#include <seastar/core/thread.hh>
#include <seastar/util/defer.hh>
#include <seastar/util/file.hh>

#include <fmt/format.h>
#include <fmt/ostream.h>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace {

const std::vector<ss::sstring> kept_keys{"a", "b", "c"};
const std::vector<ss::sstring> deleted_keys{"x1", "x2"};

std::vector<ss::sstring> all_keys() {
    auto keys = kept_keys;
    keys.insert(keys.end(), deleted_keys.begin(), deleted_keys.end());
    return keys;
}

compaction::compaction_config make_compaction_config() {
    const auto& cfg = config::shard_local_cfg();
    return compaction::compaction_config{
      .max_keys = cfg.compaction_max_keys(),
      .read_slice_entries = cfg.compaction_read_slice_entries(),
      .persist = cfg.compaction_persist_logs(),
      .data_directory = std::filesystem::path(
        std::string(cfg.data_directory())),
    };
}

} // namespace

int application::run(int ac, char** av) {
    std::setvbuf(stdout, nullptr, _IOLBF, 1024);
    ss::app_template app(setup_app_config());
    app.add_options()(
      "keel-cfg", po::value<std::string>(), ".yaml file config for keel");
    app.add_options()(
      "topic",
      po::value<std::string>()->default_value("compaction-demo"),
      "topic the demo writes to and compacts");

    return app.run(ac, av, [this, &app] {
        auto& cfg = app.configuration();
        validate_arguments(cfg);
        return ss::async([this, &cfg] {
            try {
                auto deferred = ss::defer([this] {
                    shutdown();
                    klog(_log.info, "Shutdown complete.");
                });
                // must initialize configuration before services
                hydrate_config(cfg);
                initialize();
                const auto& topic = cfg["topic"].as<std::string>();
                run_scenario(
                  model::topic(ss::sstring(topic.data(), topic.size())));
            } catch (const ss::abort_requested_exception&) {
                klog(_log.info, "keel aborted");
                return 0;
            } catch (...) {
                klog(_log.error, "Failure: {}", std::current_exception());
                return 1;
            }
            return 0;
        });
    });
}

void application::validate_arguments(const po::variables_map& cfg) {
    if (!cfg.count("keel-cfg")) {
        throw std::invalid_argument("Missing keel-cfg flag");
    }
}

ss::app_template::config application::setup_app_config() {
    ss::app_template::config app_cfg;
    app_cfg.name = "keel";
    return app_cfg;
}

void application::hydrate_config(const po::variables_map& cfg) {
    std::filesystem::path cfg_path(cfg["keel-cfg"].as<std::string>());
    auto raw = ss::util::read_entire_file_contiguous(cfg_path).get();
    auto config = YAML::Load(std::string(raw));

    auto errors = config::shard_local_cfg().load(config);
    for (const auto& [name, error] : errors) {
        klog(_log.warn, "Property '{}' validation error: {}", name, error);
    }
    if (!errors.empty()) {
        throw std::invalid_argument(
          fmt::format("Invalid configuration in {}", cfg_path.native()));
    }

    std::vector<ss::sstring> items;
    config::shard_local_cfg().for_each(
      [&items](const config::base_property& item) {
          items.push_back(
            ss::sstring(fmt::format("keel.{}\t- {}", item, item.desc())));
      });
    std::sort(items.begin(), items.end());
    for (const auto& item : items) {
        klog(_log.info, "{}", item);
    }
}

void application::initialize() {
    _logs = std::make_unique<storage::log_manager>(storage::log_manager_config{
      .max_segment_entries
      = config::shard_local_cfg().log_segment_max_entries(),
    });
    _compaction = std::make_unique<compaction::compaction_service>(
      *_logs, make_compaction_config());
    klog(
      _log.info,
      "Started compaction service with {}",
      _compaction->config());
}

void application::shutdown() {
    if (_compaction) {
        _compaction->stop().get();
    }
    if (_logs) {
        _logs->stop().get();
    }
}

ss::future<> application::write_all(
  const model::topic& topic,
  const std::vector<ss::sstring>& keys,
  int32_t value) {
    auto log = _logs->get(topic);
    for (const auto& k : keys) {
        auto o = co_await log->append(k, model::encode_int32_value(value));
        klog(_log.debug, "Wrote {}={} at offset {}", k, value, o);
    }
}

ss::future<> application::write_tombstones(
  const model::topic& topic, const std::vector<ss::sstring>& keys) {
    auto log = _logs->get(topic);
    for (const auto& k : keys) {
        auto o = co_await log->append(k, bytes{});
        klog(_log.debug, "Deleted {} at offset {}", k, o);
    }
}

ss::future<std::vector<model::entry>>
application::read_view(const model::topic& topic, bool read_compacted) {
    storage::log_reader_config cfg(model::offset(0));
    cfg.read_compacted = read_compacted;
    auto reader = co_await _compaction->make_reader(topic, std::move(cfg));
    auto slice = co_await model::consume_reader_to_memory(
      std::move(reader), model::no_timeout);
    co_return std::vector<model::entry>(
      std::make_move_iterator(slice.begin()),
      std::make_move_iterator(slice.end()));
}

void application::print_view(
  std::string_view title, const std::vector<model::entry>& entries) {
    fmt::print(std::cout, "{} ({} entries)\n", title, entries.size());
    for (const auto& e : entries) {
        auto v = model::decode_int32_value(e);
        fmt::print(
          std::cout,
          "  offset={} key={} value={}\n",
          e.offset,
          e.key ? *e.key : ss::sstring("<none>"),
          v ? fmt::to_string(*v) : std::string("null"));
    }
    std::cout.flush();
}

void application::print_stats(const model::topic& topic) {
    auto json = compaction::to_json(_compaction->internal_stats(topic));
    klog(_log.info, "Internal stats of {}: {}", topic, json);
    fmt::print(std::cout, "{}\n", json);
}

void application::run_scenario(const model::topic& topic) {
    _logs->manage(topic).get();
    const auto keys = all_keys();

    auto compact_and_print = [this, &topic](std::string_view title) {
        _compaction->compact(topic).get();
        print_view(title, read_view(topic, true).get());
        print_stats(topic);
    };

    write_all(topic, keys, 1).get();
    print_stats(topic);
    compact_and_print("compacted after writing 1");

    write_all(topic, keys, 2).get();
    compact_and_print("compacted after writing 2");

    write_tombstones(topic, deleted_keys).get();
    compact_and_print("compacted after deleting x1, x2");

    print_view("raw", read_view(topic, false).get());
}
