/**
 * @file export.cpp
 * @brief Library-wide exported functions (version, platform, error strings)
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#include "lsx/core/common.h"
#include "lsx/version.h"

extern "C" {

const char* lsx_version(void) {
    return LSX_VERSION_STRING;
}

const char* lsx_platform(void) {
    return LSX_PLATFORM_NAME;
}

const char* lsx_error_string(lsx_error_t error) {
    switch (error) {
        case LSX_SUCCESS:
            return "Success";
        case LSX_ERROR_INVALID_PARAM:
            return "Invalid parameter";
        case LSX_ERROR_INVALID_KEY:
            return "Invalid key size (must be 16, 24, or 32 bytes)";
        case LSX_ERROR_UNALIGNED_INPUT:
            return "Input length is not a multiple of the block size";
        case LSX_ERROR_LIMIT_EXCEEDED:
            return "Cannot hash 2^61 bytes or more with one state";
        case LSX_ERROR_CONTEXT_FINALIZED:
            return "Hash state already finished";
        case LSX_ERROR_INTERNAL:
            return "Internal error";
        default:
            return "Unknown error";
    }
}

} // extern "C"
