/**
 * @file version.cpp
 * @brief SDK 버전 문자열
 */

#include "facemask.h"

namespace facemask {

const char* get_version() {
    return FACEMASK_VERSION_STRING;
}

} // namespace facemask
