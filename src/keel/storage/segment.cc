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

#include "storage/segment.h"

#include "base/vassert.h"
#include "base/vlog.h"
#include "storage/entry_framing.h"
#include "storage/errc.h"
#include "storage/exceptions.h"
#include "storage/logger.h"

#include <seastar/core/coroutine.hh>

#include <fmt/format.h>

#include <algorithm>
#include <string_view>

namespace storage {

void segment::close() {
    klog(stlog.debug, "Closing segment {}", *this);
    _closed = true;
    _frames.clear();
    _frames.shrink_to_fit();
}

void segment::append(const model::entry& e) {
    append_frame(e.offset, encode_frame(e));
}

void segment::append_frame(model::offset o, ss::temporary_buffer<char> frame) {
    kassert(!_sealed && !_closed, "Append to a read only segment {}", *this);
    kassert(
      o >= _base_offset && (_offsets.empty() || o > _offsets.back()),
      "Offset {} does not follow segment {}",
      o,
      *this);
    _size_bytes += frame.size();
    _offsets.push_back(o);
    _frames.push_back(std::move(frame));
}

model::entry_reader::data_t segment::read(
  model::offset start, model::offset end, size_t max_entries) const {
    if (unlikely(_closed)) {
        throw storage_exception(
          errc::read_failure,
          fmt::format(
            "segment with base offset {} was truncated before it could be "
            "read",
            _base_offset));
    }
    model::entry_reader::data_t ret;
    auto it = std::lower_bound(_offsets.begin(), _offsets.end(), start);
    for (auto idx = static_cast<size_t>(std::distance(_offsets.begin(), it));
         idx < _offsets.size() && _offsets[idx] < end
         && ret.size() < max_entries;
         ++idx) {
        const auto& f = _frames[idx];
        auto decoded = decode_frame(std::string_view(f.get(), f.size()));
        ret.push_back(std::move(decoded.entry));
    }
    return ret;
}

ss::future<> segment::write_to(ss::output_stream<char>& out) const {
    for (const auto& f : _frames) {
        co_await out.write(f.get(), f.size());
    }
}

segment
segment::from_buffer(model::offset base_offset, ss::temporary_buffer<char> buf) {
    segment s(base_offset);
    frame_parser parser(std::string_view(buf.get(), buf.size()));
    size_t pos = 0;
    while (!parser.end_of_stream()) {
        auto e = parser.next();
        const auto frame_size = parser.bytes_consumed() - pos;
        s.append_frame(e.offset, buf.share(pos, frame_size));
        pos = parser.bytes_consumed();
    }
    return s;
}

std::ostream& operator<<(std::ostream& o, const segment& s) {
    fmt::print(
      o,
      "{{base_offset: {}, last_offset: {}, entries: {}, size_bytes: {}, "
      "sealed: {}, closed: {}}}",
      s._base_offset,
      s.last_offset(),
      s.entry_count(),
      s._size_bytes,
      s._sealed,
      s._closed);
    return o;
}

} // namespace storage
