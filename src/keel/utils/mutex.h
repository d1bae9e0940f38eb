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

#include <seastar/core/semaphore.hh>
#include <seastar/core/sstring.hh>


/*
 * A binary semaphore with a name, so that waiters blocked on it show up in
 * diagnostics.
 *
 *    mutex m{"compaction::topic"};
 *    auto units = co_await m.get_units();
 */
class mutex {
public:
    using units = ss::semaphore_units<>;

    explicit mutex(ss::sstring name)
      : _name(std::move(name))
      , _sem(1) {}

    ss::future<units> get_units() noexcept { return ss::get_units(_sem, 1); }

    void broken() noexcept { _sem.broken(); }

    bool ready() const noexcept {
        return _sem.waiters() == 0 && _sem.available_units() == 1;
    }

    size_t waiters() const noexcept { return _sem.waiters(); }

    const ss::sstring& name() const { return _name; }

private:
    ss::sstring _name;
    ss::semaphore _sem;
};
