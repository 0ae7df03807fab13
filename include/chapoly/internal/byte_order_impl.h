/**
 * @file byte_order_impl.h
 * @brief Little-endian load/store helpers shared by ChaCha20, Poly1305 and
 *        the AEAD length block
 *
 * Internal header, not part of the public API.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef CHAPOLY_INTERNAL_BYTE_ORDER_IMPL_H
#define CHAPOLY_INTERNAL_BYTE_ORDER_IMPL_H

#include <cstdint>

namespace chapoly {
namespace internal {

inline uint32_t load32_le(const uint8_t* p) {
    return static_cast<uint32_t>(p[0]) |
           (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) |
           (static_cast<uint32_t>(p[3]) << 24);
}

inline void store32_le(uint8_t* p, uint32_t v) {
    p[0] = static_cast<uint8_t>(v);
    p[1] = static_cast<uint8_t>(v >> 8);
    p[2] = static_cast<uint8_t>(v >> 16);
    p[3] = static_cast<uint8_t>(v >> 24);
}

inline void store64_le(uint8_t* p, uint64_t v) {
    for (int i = 0; i < 8; i++) {
        p[i] = static_cast<uint8_t>(v >> (i * 8));
    }
}

} // namespace internal
} // namespace chapoly

#endif // CHAPOLY_INTERNAL_BYTE_ORDER_IMPL_H
