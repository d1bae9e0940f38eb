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

#include <gnutls/crypto.h>
#include <gnutls/gnutls.h>

#include <array>
#include <exception>
#include <string_view>

class hash_exception final : public std::exception {
public:
    explicit hash_exception(const char* msg)
      : _msg(msg) {}

    const char* what() const noexcept final { return _msg; }

private:
    const char* _msg;
};

namespace internal {

template<gnutls_digest_algorithm_t Algo, size_t DigestSize>
class hash {
    static_assert(DigestSize > 0, "digest cannot be zero length");

public:
    static constexpr size_t digest_size = DigestSize;
    using digest_type = std::array<char, DigestSize>;

    // NOLINTNEXTLINE(hicpp-member-init, cppcoreguidelines-pro-type-member-init)
    hash() {
        int ret = gnutls_hash_init(&_handle, Algo);
        if (unlikely(ret)) {
            throw hash_exception(gnutls_strerror(ret));
        }

        ret = gnutls_hash_get_len(Algo);
        if (unlikely(ret != DigestSize)) {
            throw hash_exception("invalid digest length");
        }
    }

    hash(const hash&) = delete;
    hash& operator=(const hash&) = delete;
    hash(hash&&) = delete;
    hash& operator=(hash&&) = delete;

    ~hash() noexcept { gnutls_hash_deinit(_handle, nullptr); }

    void update(std::string_view data) { update(data.data(), data.size()); }

    /**
     * Return the current output and reset.
     */
    digest_type reset() {
        digest_type digest;
        gnutls_hash_output(_handle, digest.data());
        return digest;
    }

private:
    void update(const void* data, size_t size) {
        int ret = gnutls_hash(_handle, data, size);
        if (unlikely(ret)) {
            throw hash_exception(gnutls_strerror(ret));
        }
    }

    gnutls_hash_hd_t _handle;
};

} // namespace internal

using hash_sha256 = internal::hash<GNUTLS_DIG_SHA256, 32>; // NOLINT
