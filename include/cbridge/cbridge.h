#pragma once
/**
 * @file cbridge.h
 * @brief Main include file for ComputeBridge
 *
 * ComputeBridge - host-side GPU compute bridge with an integer handle API
 *
 * Include this single header to access all public ComputeBridge APIs.
 */

#include "cbridge/core/types.h"

#include "cbridge/gpu/compute_backend.h"

#include "cbridge/bridge/result.h"
#include "cbridge/bridge/handle_table.h"
#include "cbridge/bridge/device_context.h"
#include "cbridge/bridge/function_registry.h"
#include "cbridge/bridge/buffer_registry.h"
#include "cbridge/bridge/dispatch_engine.h"
#include "cbridge/bridge/bridge.h"
#include "cbridge/bridge/typed_buffer.h"

#include "cbridge/interface/api.h"
#include "cbridge/interface/config.h"

/**
 * @namespace cbridge
 * @brief Root namespace for all ComputeBridge components
 */
namespace cbridge {

/**
 * @brief Library version information
 */
constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 2;
constexpr int VERSION_PATCH = 0;

/**
 * @brief Revision of the C boundary protocol
 */
constexpr int API_REVISION = 2;

/**
 * @brief Get version string
 * @return Version string in format "major.minor.patch"
 */
constexpr const char* GetVersionString() noexcept {
    return "0.2.0";
}

} // namespace cbridge
