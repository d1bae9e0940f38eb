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
#include "base/source_location.h"

// NOLINTNEXTLINE
#define fmt_with_ctx(method, fmt, args...)                                     \
    method("{} - " fmt, klog::file_line::current(), ##args)

// Logs through a seastar logger level method, e.g.
//   klog(cmplog.info, "published {}", boundary);
// NOLINTNEXTLINE
#define klog(method, fmt, args...) fmt_with_ctx(method, fmt, ##args)

