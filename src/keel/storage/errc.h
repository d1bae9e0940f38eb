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

namespace storage {

enum class errc {
    success = 0,
    read_failure,
    corrupted_frame,
    log_closed,
    offset_out_of_range,
    entry_too_large,
};

inline std::string to_string(errc err) {
    switch (err) {
    case errc::success:
        return "storage::errc::success";
    case errc::read_failure:
        return "storage::errc::read_failure";
    case errc::corrupted_frame:
        return "storage::errc::corrupted_frame";
    case errc::log_closed:
        return "storage::errc::log_closed";
    case errc::offset_out_of_range:
        return "storage::errc::offset_out_of_range";
    case errc::entry_too_large:
        return "storage::errc::entry_too_large";
    default:
        return "storage::errc::unknown";
    }
}

struct errc_category final : public std::error_category {
    const char* name() const noexcept final { return "storage::errc"; }

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

} // namespace storage
namespace std {
template<>
struct is_error_code_enum<storage::errc> : true_type {};
} // namespace std
