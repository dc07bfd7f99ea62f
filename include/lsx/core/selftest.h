/**
 * @file selftest.h
 * @brief Built-in known-answer self tests
 *
 * Runs the FIPS 180-4 SHA-256 vectors and the Twofish ECB known-answer
 * vectors (encrypt and decrypt) against the compiled library.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#ifndef LSX_CORE_SELFTEST_H
#define LSX_CORE_SELFTEST_H

#include "lsx/core/common.h"

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Run all known-answer tests
 * @return LSX_SUCCESS if every vector matches, LSX_ERROR_INTERNAL otherwise
 */
LSX_API lsx_error_t lsx_selftest(void);

#ifdef __cplusplus
}

#include <string>
#include <vector>

namespace lsx {
namespace selftest {

struct Result {
    std::string name;
    bool passed;
    std::string detail;   // "passed", or "got X expected Y"
};

/**
 * @brief Run every known-answer test and report each one
 */
std::vector<Result> runAll();

} // namespace selftest
} // namespace lsx

#endif // __cplusplus

#endif // LSX_CORE_SELFTEST_H
