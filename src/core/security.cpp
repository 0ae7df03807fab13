/**
 * @file security.cpp
 * @brief Memory erasure, constant-time comparison and OS entropy
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "chapoly/core/security.h"

#include <cstdint>
#include <cstring>

#if defined(_WIN32)
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#include <windows.h>
#include <bcrypt.h>
#elif defined(__APPLE__)
#include <Security/SecRandom.h>
#else
#include <cerrno>
#include <fcntl.h>
#include <unistd.h>
#if defined(__linux__)
#include <sys/syscall.h>
#endif
#endif

namespace chapoly {

namespace {

// Calls through a volatile pointer cannot be proven dead and removed
void* (*volatile g_memset)(void*, int, size_t) = std::memset;

#if !defined(_WIN32) && !defined(__APPLE__)

/**
 * @brief Owns a file descriptor for the lifetime of one entropy read
 */
class FdGuard {
public:
    explicit FdGuard(int fd) : fd_(fd) {}
    ~FdGuard() {
        if (fd_ >= 0) {
            close(fd_);
        }
    }
    FdGuard(const FdGuard&) = delete;
    FdGuard& operator=(const FdGuard&) = delete;

    int get() const { return fd_; }

private:
    int fd_;
};

#if defined(__linux__) && defined(SYS_getrandom)
// Returns the number of bytes still missing; nonzero means fall back
size_t fill_getrandom(uint8_t* out, size_t len) {
    while (len > 0) {
        long n = syscall(SYS_getrandom, out, len, 0);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            break;
        }
        out += n;
        len -= static_cast<size_t>(n);
    }
    return len;
}
#endif

bool fill_urandom(uint8_t* out, size_t len) {
    FdGuard fd(open("/dev/urandom", O_RDONLY | O_CLOEXEC));
    if (fd.get() < 0) {
        return false;
    }
    while (len > 0) {
        ssize_t n = read(fd.get(), out, len);
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            return false;
        }
        out += n;
        len -= static_cast<size_t>(n);
    }
    return true;
}

#endif

bool fill_from_os(uint8_t* out, size_t len) {
#if defined(_WIN32)
    while (len > 0) {
        ULONG chunk = len > 0x10000000u ? 0x10000000u : static_cast<ULONG>(len);
        if (BCryptGenRandom(nullptr, out, chunk, BCRYPT_USE_SYSTEM_PREFERRED_RNG) != 0) {
            return false;
        }
        out += chunk;
        len -= chunk;
    }
    return true;
#elif defined(__APPLE__)
    return SecRandomCopyBytes(kSecRandomDefault, len, out) == errSecSuccess;
#else
#if defined(__linux__) && defined(SYS_getrandom)
    size_t missing = fill_getrandom(out, len);
    if (missing == 0) {
        return true;
    }
    out += len - missing;
    len = missing;
#endif
    return fill_urandom(out, len);
#endif
}

void zero_bytes(void* ptr, size_t len) {
    if (ptr == nullptr || len == 0) {
        return;
    }
#if defined(_WIN32)
    SecureZeroMemory(ptr, len);
#else
    g_memset(ptr, 0, len);
    __asm__ __volatile__("" : : "r"(ptr) : "memory");
#endif
}

bool equal_bytes(const void* a, const void* b, size_t len) {
    if (a == nullptr || b == nullptr) {
        return false;
    }
    const volatile uint8_t* x = static_cast<const volatile uint8_t*>(a);
    const volatile uint8_t* y = static_cast<const volatile uint8_t*>(b);

    uint32_t acc = 0;
    for (size_t i = 0; i < len; ++i) {
        acc |= static_cast<uint32_t>(x[i] ^ y[i]);
    }
    // acc is 0..255; (acc - 1) >> 8 has bit 0 set only when acc == 0
    return ((acc - 1u) >> 8) & 1u;
}

chapoly_error_t random_fill(void* buf, size_t len) {
    if (len == 0) {
        return CHAPOLY_SUCCESS;
    }
    if (buf == nullptr) {
        return CHAPOLY_ERROR_INVALID_PARAM;
    }
    if (!fill_from_os(static_cast<uint8_t*>(buf), len)) {
        zero_bytes(buf, len);
        return CHAPOLY_ERROR_RANDOM_FAILED;
    }
    return CHAPOLY_SUCCESS;
}

} // namespace
} // namespace chapoly

extern "C" {

void chapoly_secure_zero(void* ptr, size_t len) {
    chapoly::zero_bytes(ptr, len);
}

int chapoly_secure_compare(const void* a, const void* b, size_t len) {
    return chapoly::equal_bytes(a, b, len) ? 1 : 0;
}

chapoly_error_t chapoly_random_bytes(void* buf, size_t len) {
    return chapoly::random_fill(buf, len);
}

} // extern "C"
