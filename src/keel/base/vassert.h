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

#include "base/likely.h"

#include <fmt/format.h>

#include <string>

namespace detail {
[[noreturn]] void kassert_hook(std::string msg);
}
/** Used like assert(condition, msg), i.e. the condition is what must hold:
 *
 *   kassert(o > _last_offset, "offset {} is not monotonic", o);
 *
 * Only for invariants whose violation is a programming error. Recoverable
 * failures are reported through error codes and exceptions.
 */
// NOLINTNEXTLINE(cppcoreguidelines-macro-usage)
#define kassert(x, msg, args...)                                               \
    /* NOLINTNEXTLINE(cppcoreguidelines-avoid-do-while) */                     \
    do {                                                                       \
        /*The !(x) is not an error. see description above*/                    \
        if (unlikely(!(x))) {                                                  \
            ::detail::kassert_hook(fmt::format(                                \
              "Assert failure: ({}:{}) '{}' " msg,                             \
              __FILE__,                                                        \
              __LINE__,                                                        \
              #x,                                                              \
              ##args));                                                        \
        }                                                                      \
    } while (0)
