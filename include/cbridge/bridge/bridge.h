#pragma once
/**
 * @file bridge.h
 * @brief Public C++ API for ComputeBridge
 *
 * A Bridge owns one device context together with its function and buffer
 * registries. Bridges are independent of each other: handles issued by one
 * mean nothing to another.
 *
 * @code
 * cbridge::Bridge bridge;
 * auto fn = bridge.compile(source, "add");
 * auto a  = bridge.allocate(sizeof(float) * 1024);
 * ...
 * auto status = bridge.run(fn.value(), {1024, 1, 1}, {a.value(), b.value(), out.value()});
 * @endcode
 *
 * Every failure message is prefixed with the operation that failed, e.g.
 * "Unable to set up function: Missing function name".
 */

#include "cbridge/bridge/buffer_registry.h"
#include "cbridge/bridge/device_context.h"
#include "cbridge/bridge/dispatch_engine.h"
#include "cbridge/bridge/function_registry.h"
#include "cbridge/bridge/result.h"
#include "cbridge/interface/config.h"
#include <initializer_list>
#include <memory>
#include <span>
#include <string>

namespace cbridge {

// Forward declarations
class BridgeImpl;

/**
 * @brief Bridge facade - primary interface for users
 */
class Bridge {
public:
    /**
     * @brief Bridge with default configuration
     */
    Bridge();

    /**
     * @brief Bridge creating its backend as described by config
     */
    explicit Bridge(const config::BridgeConfig& config);

    /**
     * @brief Bridge over an injected backend
     */
    explicit Bridge(std::unique_ptr<gpu::IComputeBackend> backend,
                    const config::BridgeConfig& config = config::BridgeConfig::defaults());

    ~Bridge();

    // Non-copyable
    Bridge(const Bridge&) = delete;
    Bridge& operator=(const Bridge&) = delete;

    // Movable
    Bridge(Bridge&&) noexcept;
    Bridge& operator=(Bridge&&) noexcept;

    // ========================================================================
    // Lifecycle
    // ========================================================================

    /**
     * @brief Open the device (idempotent)
     *
     * Called implicitly by every operation below.
     */
    Status initialize();

    bool is_initialized() const;

    /**
     * @brief Release every function and buffer, then close the device
     */
    void shutdown();

    // ========================================================================
    // Functions
    // ========================================================================

    /**
     * @brief Compile kernel source and select its entry point
     * @param source Kernel source code
     * @param entry_point Name of the kernel function to run
     */
    Result<Handle> compile(const std::string& source, const std::string& entry_point);

    Result<std::string> function_name(Handle function) const;

    Status release_function(Handle function);

    // ========================================================================
    // Buffers
    // ========================================================================

    /**
     * @brief Allocate zero-initialized memory shared by host and device
     */
    Result<Handle> allocate(Int64 size_bytes);

    /**
     * @brief Stable host pointer to a buffer's memory
     */
    Result<void*> view(Handle buffer);

    Result<SizeT> buffer_size(Handle buffer) const;

    Status release_buffer(Handle buffer);

    // ========================================================================
    // Dispatch
    // ========================================================================

    /**
     * @brief Run a function and block until it completes
     * @param buffers buffers[i] is bound to kernel argument i
     */
    Status run(Handle function, const Grid& grid, std::span<const Handle> buffers);

    Status run(Handle function, const Grid& grid, std::initializer_list<Handle> buffers);

    // ========================================================================
    // Components
    // ========================================================================

    /**
     * @brief Provide a host implementation for a kernel name
     *
     * Only the CPU backend executes host functions; call before compile().
     */
    Status register_host_function(const std::string& name, gpu::HostKernelFunc func);

    const config::BridgeConfig& config() const;

    DeviceContext& context();
    FunctionRegistry& functions();
    BufferRegistry& buffers();

private:
    std::unique_ptr<BridgeImpl> m_impl;
};

} // namespace cbridge
