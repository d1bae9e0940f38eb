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
#include "model/fundamental.h"
#include "storage/segment.h"

#include <seastar/core/future.hh>
#include <seastar/core/shared_ptr.hh>

#include <filesystem>

namespace storage {

/// Loads a file of concatenated frames as a sealed segment. Fails with
/// errc::read_failure when the file is short and errc::corrupted_frame when
/// a frame does not parse.
ss::future<ss::lw_shared_ptr<segment>>
read_segment_file(std::filesystem::path path, model::offset base_offset);

} // namespace storage
