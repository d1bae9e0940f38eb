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
#include "compaction/compacted_log_pointer.h"
#include "model/entry_reader.h"
#include "storage/log.h"
#include "storage/types.h"

#include <seastar/core/future.hh>

namespace compaction {

/**
 * Reader honouring cfg.read_compacted. Without it this is the raw log
 * reader. With it, offsets below the published boundary come from the
 * compacted log, one entry per key and no tombstones, and offsets at or
 * past the boundary come from the raw log, tombstones and all. Before the
 * first publish the whole range is raw.
 */
ss::future<model::entry_reader> make_compacted_reader(
  storage::log& log,
  const compacted_log_pointer& pointer,
  storage::log_reader_config cfg);

} // namespace compaction
