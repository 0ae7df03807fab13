/**
 * @file security.h
 * @brief Security primitives for chapoly - Side-channel resistant operations
 *
 * This header provides security-critical functions including:
 * - Constant-time comparison to prevent timing attacks
 * - Secure memory zeroing
 * - Cryptographically secure random number generation
 * - Scoped containers that erase secrets on every exit path
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef CHAPOLY_CORE_SECURITY_H
#define CHAPOLY_CORE_SECURITY_H

#include "chapoly/core/common.h"

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Constant-time memory comparison
 *
 * Always walks all @p len bytes; the running time does not depend on the
 * position of the first difference.
 *
 * @param a First memory region
 * @param b Second memory region
 * @param len Number of bytes to compare
 * @return 1 if equal, 0 if different or if either pointer is null
 */
CHAPOLY_API int chapoly_secure_compare(const void* a, const void* b, size_t len);

/**
 * @brief Secure memory zeroing
 *
 * Securely zeros memory, guaranteed not to be optimized away by compiler.
 * Null pointer or zero length is a no-op.
 *
 * @param ptr Pointer to memory to zero
 * @param len Number of bytes to zero
 */
CHAPOLY_API void chapoly_secure_zero(void* ptr, size_t len);

/**
 * @brief Cryptographically secure random bytes
 *
 * - Windows: BCryptGenRandom
 * - Linux: getrandom() syscall, falling back to /dev/urandom
 * - macOS: SecRandomCopyBytes
 *
 * Zero length is a no-op and accepts a null @p buf. On failure the buffer
 * is zeroed.
 *
 * @param buf Buffer to fill with random bytes
 * @param len Number of random bytes to generate
 * @return CHAPOLY_SUCCESS, CHAPOLY_ERROR_INVALID_PARAM (null @p buf with
 *         nonzero @p len) or CHAPOLY_ERROR_RANDOM_FAILED
 */
CHAPOLY_API chapoly_error_t chapoly_random_bytes(void* buf, size_t len);

#ifdef __cplusplus
} // extern "C"

#include <cstddef>
#include <type_traits>

namespace chapoly {

/**
 * @brief Fixed-size stack buffer for secret material
 *
 * Lives on the stack of the calling frame and is securely zeroed by the
 * destructor, so early returns cannot leave key or keystream bytes behind.
 */
template<typename T, size_t N>
class SecureArray {
    static_assert(std::is_trivially_copyable<T>::value,
                  "SecureArray holds plain data only");

public:
    SecureArray() noexcept : data_{} {}
    ~SecureArray() { chapoly_secure_zero(data_, sizeof(data_)); }

    // Non-copyable, non-movable: secrets stay in one place
    SecureArray(const SecureArray&) = delete;
    SecureArray& operator=(const SecureArray&) = delete;

    T* data() noexcept { return data_; }
    const T* data() const noexcept { return data_; }
    static constexpr size_t size() noexcept { return N; }
    static constexpr size_t size_bytes() noexcept { return N * sizeof(T); }

    T& operator[](size_t i) { return data_[i]; }
    const T& operator[](size_t i) const { return data_[i]; }

private:
    T data_[N];
};

/**
 * @brief Scoped holder for a C context struct (cipher or MAC state)
 *
 * The wrapped object is zeroed on destruction.
 */
template<typename T>
class SecureObject {
    static_assert(std::is_trivially_copyable<T>::value,
                  "SecureObject holds plain C structs only");

public:
    SecureObject() noexcept : value_{} {}
    ~SecureObject() { chapoly_secure_zero(&value_, sizeof(T)); }

    SecureObject(const SecureObject&) = delete;
    SecureObject& operator=(const SecureObject&) = delete;

    T* get() noexcept { return &value_; }
    const T* get() const noexcept { return &value_; }
    T* operator->() noexcept { return &value_; }

private:
    T value_;
};

/**
 * @brief Constant-time comparison for C++ containers
 */
template<typename Container>
bool secure_compare(const Container& a, const Container& b) {
    if (a.size() != b.size()) return false;
    if (a.size() == 0) return true;
    return chapoly_secure_compare(a.data(), b.data(),
                                  a.size() * sizeof(typename Container::value_type)) == 1;
}

} // namespace chapoly

#endif // __cplusplus

#endif // CHAPOLY_CORE_SECURITY_H
