/**
 * @file version.h
 * @brief Unified Version Information for chapoly Library
 *
 * This is the SINGLE SOURCE OF TRUTH for all version information.
 * CMakeLists.txt reads the numbers below for the project version.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#ifndef CHAPOLY_VERSION_H
#define CHAPOLY_VERSION_H

/**
 * @defgroup Version Library Version Information
 * @{
 */

/** Major version number (API breaking changes) */
#define CHAPOLY_VERSION_MAJOR 1

/** Minor version number (new features, backward compatible) */
#define CHAPOLY_VERSION_MINOR 2

/** Patch version number (bug fixes) */
#define CHAPOLY_VERSION_PATCH 0

/** Full version string "major.minor.patch" */
#define CHAPOLY_VERSION_STRING "1.2.0"

/** Version as single integer: (major * 10000 + minor * 100 + patch) */
#define CHAPOLY_VERSION_NUMBER ((CHAPOLY_VERSION_MAJOR * 10000) + \
                                (CHAPOLY_VERSION_MINOR * 100) + \
                                CHAPOLY_VERSION_PATCH)

/** Library name */
#define CHAPOLY_LIBRARY_NAME "chapoly"

/** Full library description */
#define CHAPOLY_DESCRIPTION "ChaCha20-Poly1305 AEAD (RFC 8439)"

/** Build type identifier */
#ifdef NDEBUG
#define CHAPOLY_BUILD_TYPE "Release"
#else
#define CHAPOLY_BUILD_TYPE "Debug"
#endif

/**
 * @brief Check if library version is at least the specified version
 */
#define CHAPOLY_VERSION_AT_LEAST(major, minor, patch) \
    (CHAPOLY_VERSION_NUMBER >= ((major) * 10000 + (minor) * 100 + (patch)))

/** @} */

#endif /* CHAPOLY_VERSION_H */
