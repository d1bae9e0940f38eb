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
#include "storage/errc.h"

#include <seastar/core/sstring.hh>

#include <exception>
#include <system_error>
#include <utility>

namespace storage {

class storage_exception : public std::exception {
public:
    storage_exception(std::error_code ec, ss::sstring msg)
      : _ec(ec)
      , _msg(std::move(msg)) {}

    const char* what() const noexcept override { return _msg.c_str(); }

    const std::error_code& code() const noexcept { return _ec; }

private:
    std::error_code _ec;
    ss::sstring _msg;
};

} // namespace storage
