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

#include "storage/segment_file.h"

#include "base/vlog.h"
#include "storage/errc.h"
#include "storage/exceptions.h"
#include "storage/logger.h"

#include <seastar/core/coroutine.hh>
#include <seastar/core/fstream.hh>
#include <seastar/core/seastar.hh>

#include <fmt/format.h>

#include <exception>

namespace storage {

ss::future<ss::lw_shared_ptr<segment>>
read_segment_file(std::filesystem::path path, model::offset base_offset) {
    auto f = co_await ss::open_file_dma(path.native(), ss::open_flags::ro);
    auto size = co_await f.size();
    auto in = ss::make_file_input_stream(f);
    std::exception_ptr ex;
    ss::temporary_buffer<char> buf;
    try {
        buf = co_await in.read_exactly(size);
    } catch (...) {
        ex = std::current_exception();
    }
    co_await in.close();
    if (ex) {
        std::rethrow_exception(ex);
    }
    if (buf.size() != size) {
        throw storage_exception(
          errc::read_failure,
          fmt::format(
            "short read of {}: {} of {} bytes",
            path.native(),
            buf.size(),
            size));
    }
    auto seg = ss::make_lw_shared<segment>(
      segment::from_buffer(base_offset, std::move(buf)));
    seg->seal();
    klog(stlog.debug, "Loaded segment file {}: {}", path.native(), *seg);
    co_return seg;
}

} // namespace storage
