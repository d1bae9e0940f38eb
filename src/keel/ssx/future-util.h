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

#include <seastar/core/abort_source.hh>
#include <seastar/core/coroutine.hh>
#include <seastar/core/future.hh>
#include <seastar/core/gate.hh>
#include <seastar/core/semaphore.hh>

#include <utility>

namespace ssx {

/// Sink for detached fibers:
///
///   ssx::background = ssx::spawn_with_gate_then(...);
///
/// Makes it easy to search for places that start background work.
namespace detail {
struct background_t {
    template<typename T>
    constexpr void operator=(T&&) const noexcept {}
};
} // namespace detail
inline constexpr detail::background_t background;

/// Awaits \p fut, dropping the exception types that are expected while a
/// service shuts down.
inline seastar::future<>
ignore_shutdown_exceptions(seastar::future<> fut) noexcept {
    try {
        co_await std::move(fut);
    } catch (const seastar::abort_requested_exception&) {
    } catch (const seastar::gate_closed_exception&) {
    } catch (const seastar::broken_semaphore&) {
    }
}

/// Runs \p func inside gate \p g. The caller never sees
/// gate_closed_exception or abort_requested_exception, so it can attach its
/// own logging of real failures.
template<typename Func>
inline auto spawn_with_gate_then(seastar::gate& g, Func&& func) noexcept {
    return ignore_shutdown_exceptions(
      seastar::try_with_gate(g, std::forward<Func>(func)));
}

template<typename Func>
inline void spawn_with_gate(seastar::gate& g, Func&& func) noexcept {
    background = spawn_with_gate_then(g, std::forward<Func>(func));
}

} // namespace ssx
