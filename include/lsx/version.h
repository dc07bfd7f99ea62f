/**
 * @file version.h
 * @brief Unified Version Information for lsx Library
 *
 * This is the SINGLE SOURCE OF TRUTH for all version information.
 * When releasing a new version, ONLY modify this file.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#ifndef LSX_VERSION_H
#define LSX_VERSION_H

/**
 * @defgroup Version Library Version Information
 * @{
 */

/** Major version number (API breaking changes) */
#define LSX_VERSION_MAJOR 1

/** Minor version number (new features, backward compatible) */
#define LSX_VERSION_MINOR 1

/** Patch version number (bug fixes) */
#define LSX_VERSION_PATCH 0

/** Full version string "major.minor.patch" */
#define LSX_VERSION_STRING "1.1.0"

/** Version as single integer: (major * 10000 + minor * 100 + patch) */
#define LSX_VERSION_NUMBER ((LSX_VERSION_MAJOR * 10000) + \
                            (LSX_VERSION_MINOR * 100) + \
                            LSX_VERSION_PATCH)

/** Library name */
#define LSX_LIBRARY_NAME "lsx"

/** Full library description */
#define LSX_DESCRIPTION "SHA-256 and Twofish for allocation-free environments"

/** Build type identifier */
#ifdef NDEBUG
#define LSX_BUILD_TYPE "Release"
#else
#define LSX_BUILD_TYPE "Debug"
#endif

/**
 * @brief Check if library version is at least the specified version
 */
#define LSX_VERSION_AT_LEAST(major, minor, patch) \
    (LSX_VERSION_NUMBER >= ((major) * 10000 + (minor) * 100 + (patch)))

/** @} */

#endif /* LSX_VERSION_H */
