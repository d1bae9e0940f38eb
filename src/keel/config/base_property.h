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

#include <seastar/core/sstring.hh>

#include <yaml-cpp/yaml.h>

#include <fmt/ostream.h>

#include <iosfwd>
#include <optional>
#include <string_view>

namespace config {

class config_store;

enum class required : char {
    yes,
    no,
};

class base_property {
public:
    struct metadata {
        config::required required{config::required::no};
        std::string_view example;
    };

    base_property(
      config_store& conf,
      std::string_view name,
      std::string_view desc,
      metadata meta);

    base_property(const base_property&) = delete;
    base_property& operator=(const base_property&) = delete;
    base_property(base_property&&) = delete;
    base_property& operator=(base_property&&) = delete;
    virtual ~base_property() noexcept = default;

    const std::string_view& name() const { return _name; }
    const std::string_view& desc() const { return _desc; }
    required is_required() const { return _meta.required; }
    std::optional<std::string_view> example() const {
        if (_meta.example.empty()) {
            return std::nullopt;
        }
        return _meta.example;
    }

    virtual void print(std::ostream&) const = 0;
    virtual void set_value(YAML::Node) = 0;
    virtual void reset() = 0;
    virtual bool is_default() const = 0;
    virtual std::string_view type_name() const = 0;

    /**
     * Validation of a proposed new value before it has been assigned
     * to this property. Returns the error message, if any.
     */
    virtual std::optional<ss::sstring> validate(YAML::Node) const = 0;

private:
    friend std::ostream& operator<<(std::ostream&, const base_property&);
    std::string_view _name;
    std::string_view _desc;
    metadata _meta;
};

} // namespace config

template<>
struct fmt::formatter<config::base_property> : fmt::ostream_formatter {};
