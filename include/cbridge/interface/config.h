#pragma once
/**
 * @file config.h
 * @brief Bridge configuration loading and management
 */

#include "cbridge/core/types.h"
#include "cbridge/gpu/compute_backend.h"
#include <string>

namespace cbridge::config {

/**
 * @brief Bridge configuration loaded from XML
 */
struct BridgeConfig {
    // Device
    gpu::BackendType backend{gpu::BackendType::Auto};
    UInt32 device_index{0};

    // Compiler
    std::string compiler_options;

    // Diagnostics
    bool profiling{false};
    bool debug{false};

    /**
     * @brief Load configuration from XML file
     * @throws std::runtime_error if the file is unreadable or malformed
     */
    static BridgeConfig load(const std::string& path);

    /**
     * @brief Create default configuration
     */
    static BridgeConfig defaults();

    /**
     * @brief Save configuration to XML file
     */
    bool save(const std::string& path) const;

    /**
     * @brief Options handed to the compute backend at initialization
     */
    gpu::BackendOptions to_backend_options() const;
};

} // namespace cbridge::config
