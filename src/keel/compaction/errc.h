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

#include <ostream>
#include <string>
#include <system_error>

namespace compaction {

enum class errc {
    success = 0,
    // the raw log could not be read, or a segment was removed mid run
    read_failure,
    // the compacted log could not be written or sealed
    write_failure,
    // another publish won the race for the compacted log pointer
    pointer_swap_failure,
    key_limit_exceeded,
    topic_not_found,
    aborted,
};

inline std::string to_string(errc err) {
    switch (err) {
    case errc::success:
        return "compaction::errc::success";
    case errc::read_failure:
        return "compaction::errc::read_failure";
    case errc::write_failure:
        return "compaction::errc::write_failure";
    case errc::pointer_swap_failure:
        return "compaction::errc::pointer_swap_failure";
    case errc::key_limit_exceeded:
        return "compaction::errc::key_limit_exceeded";
    case errc::topic_not_found:
        return "compaction::errc::topic_not_found";
    case errc::aborted:
        return "compaction::errc::aborted";
    default:
        return "compaction::errc::unknown";
    }
}

struct errc_category final : public std::error_category {
    const char* name() const noexcept final { return "compaction::errc"; }

    std::string message(int c) const final {
        return to_string(static_cast<errc>(c));
    }
};
inline const std::error_category& error_category() noexcept {
    static errc_category e;
    return e;
}
inline std::error_code make_error_code(errc e) noexcept {
    return std::error_code(static_cast<int>(e), error_category());
}

inline std::ostream& operator<<(std::ostream& os, errc err) {
    return os << to_string(err);
}

} // namespace compaction
namespace std {
template<>
struct is_error_code_enum<compaction::errc> : true_type {};
} // namespace std
