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
#include "config/base_property.h"
#include "config/convert.h"

#include <seastar/core/sstring.hh>
#include <seastar/util/noncopyable_function.hh>

#include <fmt/format.h>
#include <fmt/ostream.h>

#include <optional>
#include <ostream>
#include <stdexcept>
#include <string_view>
#include <type_traits>

namespace config {

template<class T>
class property final : public base_property {
public:
    using value_type = T;
    using validator =
      typename ss::noncopyable_function<std::optional<ss::sstring>(const T&)>;

    property(
      config_store& conf,
      std::string_view name,
      std::string_view desc,
      base_property::metadata meta = {},
      value_type def = value_type{},
      property::validator validator = property::noop_validator)
      : base_property(conf, name, desc, meta)
      , _value(def)
      , _default(std::move(def))
      , _validator(std::move(validator)) {}

    const value_type& value() const { return _value; }
    const value_type& default_value() const { return _default; }
    const value_type& operator()() const { return value(); }

    bool is_default() const final { return _value == _default; }

    void print(std::ostream& o) const final {
        fmt::print(o, "{}:{}", name(), _value);
    }

    /// Sets the value from YAML. Throws YAML::BadConversion on a value of
    /// the wrong type and std::invalid_argument when the validator rejects
    /// it.
    void set_value(YAML::Node n) final { set_value(n.as<value_type>()); }

    void set_value(value_type v) {
        if (auto err = _validator(v); err) {
            throw std::invalid_argument(
              fmt::format("{}: {}", name(), *err));
        }
        _value = std::move(v);
    }

    std::optional<ss::sstring> validate(const value_type& v) const {
        return _validator(v);
    }

    std::optional<ss::sstring> validate(YAML::Node n) const final {
        return validate(n.as<value_type>());
    }

    void reset() final { _value = _default; }

    std::string_view type_name() const final {
        if constexpr (std::is_same_v<T, bool>) {
            return "boolean";
        } else if constexpr (std::is_integral_v<T>) {
            return "integer";
        } else if constexpr (std::is_same_v<T, ss::sstring>) {
            return "string";
        } else {
            return "unknown";
        }
    }

private:
    static std::optional<ss::sstring> noop_validator(const value_type&) {
        return std::nullopt;
    }

    value_type _value;
    const value_type _default;
    validator _validator;
};

} // namespace config
