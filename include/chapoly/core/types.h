/**
 * @file types.h
 * @brief Type definitions for chapoly library
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#ifndef CHAPOLY_CORE_TYPES_H
#define CHAPOLY_CORE_TYPES_H

#include <stdint.h>
#include <stddef.h>

#ifdef __cplusplus

#include <vector>

namespace chapoly {

// Byte vector
using ByteVec = std::vector<uint8_t>;

} // namespace chapoly

#endif // __cplusplus

#endif // CHAPOLY_CORE_TYPES_H
