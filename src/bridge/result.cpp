/**
 * @file result.cpp
 * @brief Error taxonomy names
 */

#include "cbridge/bridge/result.h"

namespace cbridge {

const char* error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:           return "None";
        case ErrorKind::Initialization: return "Initialization";
        case ErrorKind::Compilation:    return "Compilation";
        case ErrorKind::Allocation:     return "Allocation";
        case ErrorKind::Lookup:         return "Lookup";
        case ErrorKind::Dispatch:       return "Dispatch";
        default:                        return "Unknown";
    }
}

} // namespace cbridge
