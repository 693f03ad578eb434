#pragma once

#define DELTACODE_VERSION_MAJOR 1
#define DELTACODE_VERSION_MINOR 0
#define DELTACODE_VERSION_PATCH 0
#define DELTACODE_VERSION_STRING "1.0.0"

namespace deltacode {

inline const char* version() {
    return DELTACODE_VERSION_STRING;
}

} // namespace deltacode
