/**
 * @file error.cpp
 * @brief chapoly::Error implementation
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "chapoly/core/error.h"

namespace chapoly {

Error::Error(chapoly_error_t code)
    : std::runtime_error(chapoly_error_string(code)), code_(code) {}

Error::Error(chapoly_error_t code, const std::string& context)
    : std::runtime_error(context + ": " + chapoly_error_string(code)), code_(code) {}

void throw_if_error(chapoly_error_t err, const char* context) {
    if (err != CHAPOLY_SUCCESS) {
        throw Error(err, context);
    }
}

} // namespace chapoly
