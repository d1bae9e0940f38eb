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

#include "storage/entry_framing.h"

#include "hashing/crc32c.h"
#include "storage/errc.h"
#include "storage/exceptions.h"

#include <seastar/core/byteorder.hh>

#include <fmt/format.h>

#include <algorithm>

namespace storage {

namespace {

class frame_writer {
public:
    explicit frame_writer(char* p) noexcept
      : _p(p) {}

    template<typename T>
    void write(T v) {
        ss::write_le<T>(_p, v);
        _p += sizeof(T);
    }

    void write(const char* data, size_t n) {
        _p = std::copy_n(data, n, _p);
    }

private:
    char* _p;
};

class frame_reader {
public:
    explicit frame_reader(std::string_view buf) noexcept
      : _buf(buf) {}

    size_t remaining() const { return _buf.size() - _pos; }

    template<typename T>
    T read() {
        auto v = ss::read_le<T>(_buf.data() + _pos);
        _pos += sizeof(T);
        return v;
    }

    std::string_view read_bytes(size_t n) {
        auto v = _buf.substr(_pos, n);
        _pos += n;
        return v;
    }

private:
    std::string_view _buf;
    size_t _pos{0};
};

template<typename... Args>
[[noreturn]] void
throw_corrupted(fmt::format_string<Args...> fmt, Args&&... args) {
    throw storage_exception(
      errc::corrupted_frame, fmt::format(fmt, std::forward<Args>(args)...));
}

} // namespace

ss::temporary_buffer<char> encode_frame(const model::entry& e) {
    const size_t key_size = e.key ? e.key->size() : 0;
    if (!fits_in_frame(key_size, e.payload.size())) {
        throw storage_exception(
          errc::entry_too_large,
          fmt::format(
            "entry at offset {} with a {} byte key and a {} byte payload does "
            "not fit in a frame",
            e.offset,
            key_size,
            e.payload.size()));
    }
    const size_t total = frame_overhead + key_size + e.payload.size();
    ss::temporary_buffer<char> buf(total);

    frame_writer w(buf.get_write());
    w.write<int32_t>(static_cast<int32_t>(total - frame_size_field_size));
    // crc is filled in once the rest of the frame is written
    w.write<uint32_t>(0);
    w.write<int64_t>(e.offset());
    w.write<int64_t>(e.timestamp.value());
    if (e.key) {
        w.write<int32_t>(static_cast<int32_t>(key_size));
        w.write(e.key->data(), key_size);
    } else {
        w.write<int32_t>(-1);
    }
    w.write<int32_t>(static_cast<int32_t>(e.payload.size()));
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    w.write(reinterpret_cast<const char*>(e.payload.data()), e.payload.size());

    constexpr size_t crc_start = frame_size_field_size + sizeof(uint32_t);
    crc::crc32c crc;
    crc.extend(buf.get() + crc_start, total - crc_start);
    ss::write_le<uint32_t>(buf.get_write() + frame_size_field_size, crc.value());
    return buf;
}

decoded_frame decode_frame(std::string_view buf) {
    if (buf.size() < frame_overhead) {
        throw_corrupted(
          "frame needs at least {} bytes, {} available",
          frame_overhead,
          buf.size());
    }
    const auto size = ss::read_le<int32_t>(buf.data());
    if (
      size < static_cast<int32_t>(frame_overhead - frame_size_field_size)
      || static_cast<size_t>(size) > buf.size() - frame_size_field_size) {
        throw_corrupted(
          "frame size {} out of range, {} bytes available", size, buf.size());
    }
    const size_t frame_size = frame_size_field_size + size;
    frame_reader r(buf.substr(0, frame_size));
    r.read<int32_t>();

    const auto expected_crc = r.read<uint32_t>();
    crc::crc32c crc;
    constexpr size_t crc_start = frame_size_field_size + sizeof(uint32_t);
    crc.extend(buf.data() + crc_start, frame_size - crc_start);
    if (crc.value() != expected_crc) {
        throw_corrupted(
          "frame crc mismatch, expected {:#x} computed {:#x}",
          expected_crc,
          crc.value());
    }

    model::entry e;
    e.offset = model::offset(r.read<int64_t>());
    e.timestamp = model::timestamp(r.read<int64_t>());
    const auto key_len = r.read<int32_t>();
    if (key_len >= 0) {
        if (static_cast<size_t>(key_len) + sizeof(int32_t) > r.remaining()) {
            throw_corrupted(
              "key length {} overflows frame at offset {}", key_len, e.offset);
        }
        auto k = r.read_bytes(key_len);
        e.key = ss::sstring(k.data(), k.size());
    } else if (key_len != -1) {
        throw_corrupted("invalid key length {} at offset {}", key_len, e.offset);
    }
    const auto payload_len = r.read<int32_t>();
    if (payload_len < 0 || static_cast<size_t>(payload_len) != r.remaining()) {
        throw_corrupted(
          "payload length {} does not match frame at offset {}",
          payload_len,
          e.offset);
    }
    auto p = r.read_bytes(payload_len);
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    e.payload = bytes(reinterpret_cast<const uint8_t*>(p.data()), p.size());
    return decoded_frame{.entry = std::move(e), .frame_size = frame_size};
}

model::entry frame_parser::next() {
    auto f = decode_frame(_buf.substr(_consumed));
    _consumed += f.frame_size;
    return std::move(f.entry);
}

} // namespace storage
