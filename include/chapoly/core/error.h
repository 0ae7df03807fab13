/**
 * @file error.h
 * @brief C++ exception type carrying a chapoly_error_t
 *
 * The C ABI reports failures as chapoly_error_t codes. The C++ interface
 * converts every non-success code into chapoly::Error so callers can still
 * branch on the exact failure kind through code().
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef CHAPOLY_CORE_ERROR_H
#define CHAPOLY_CORE_ERROR_H

#include "chapoly/core/common.h"

#ifdef __cplusplus

#include <stdexcept>
#include <string>

namespace chapoly {

class CHAPOLY_API Error : public std::runtime_error {
public:
    explicit Error(chapoly_error_t code);
    Error(chapoly_error_t code, const std::string& context);

    chapoly_error_t code() const noexcept { return code_; }

private:
    chapoly_error_t code_;
};

/**
 * @brief Throw chapoly::Error unless @p err is CHAPOLY_SUCCESS
 * @param err Status returned by a C ABI call
 * @param context Operation name prefixed to the message
 */
CHAPOLY_API void throw_if_error(chapoly_error_t err, const char* context);

} // namespace chapoly

#endif // __cplusplus

#endif // CHAPOLY_CORE_ERROR_H
