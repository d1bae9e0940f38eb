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
#include "compaction/compacted_log.h"
#include "model/fundamental.h"

#include <seastar/core/shared_ptr.hh>

#include <cstdint>

namespace compaction {

/**
 * The published compacted log of a topic. Holds either nothing, before the
 * first successful run, or a fully sealed log. Readers take a reference with
 * get() and keep using it even after a newer log has been published.
 */
class compacted_log_pointer {
public:
    using value_type = ss::lw_shared_ptr<const compacted_log>;

    value_type get() const { return _current; }

    /// Raw offsets below this are served from the compacted log. Zero when
    /// nothing has been published.
    model::offset boundary() const {
        return _current ? _current->boundary() : model::offset{0};
    }

    /// Number of successful swaps.
    uint64_t version() const { return _version; }

    /**
     * Publishes \p desired if the pointer still references \p expected.
     * Returns false, leaving the pointer untouched, when another publish got
     * there first.
     */
    bool compare_and_swap(const value_type& expected, value_type desired) {
        if (_current != expected) {
            return false;
        }
        _current = std::move(desired);
        ++_version;
        return true;
    }

private:
    value_type _current;
    uint64_t _version{0};
};

} // namespace compaction
