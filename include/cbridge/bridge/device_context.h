#pragma once
/**
 * @file device_context.h
 * @brief Process-independent handle on the one device a bridge uses
 *
 * The context owns the compute backend. initialize() is idempotent: the
 * first successful call opens the device and every later call is a no-op.
 * All backend calls issued by the registries go through with_backend(),
 * which serializes them because backend objects are not thread-safe.
 */

#include "cbridge/bridge/result.h"
#include "cbridge/gpu/compute_backend.h"
#include <atomic>
#include <memory>
#include <mutex>
#include <string>

namespace cbridge {

class DeviceContext {
public:
    /**
     * @brief Context that creates its backend through BackendFactory
     */
    DeviceContext();

    /**
     * @brief Context over an injected backend (type selection is skipped)
     */
    explicit DeviceContext(std::unique_ptr<gpu::IComputeBackend> backend);

    ~DeviceContext();

    DeviceContext(const DeviceContext&) = delete;
    DeviceContext& operator=(const DeviceContext&) = delete;

    // ========================================================================
    // Lifecycle
    // ========================================================================

    /**
     * @brief Open the device (idempotent)
     * @param type Backend to create when none was injected
     * @param options Device index, diagnostics and compiler options
     * @return Initialization failure if no compatible device is available
     */
    Status initialize(gpu::BackendType type = gpu::BackendType::Auto,
                      const gpu::BackendOptions& options = {});

    bool is_ready() const { return m_ready.load(std::memory_order_acquire); }

    /**
     * @brief Close the device
     *
     * Every kernel, queue and buffer created through this context must have
     * been destroyed first.
     */
    void shutdown();

    // ========================================================================
    // Device Access
    // ========================================================================

    /**
     * @brief Run func(backend) while holding the backend lock
     * @return false without calling func if the context is not ready
     */
    template <typename Func>
    bool with_backend(Func&& func) {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_backend || !is_ready()) {
            return false;
        }
        func(*m_backend);
        return true;
    }

    /**
     * @brief Capabilities of the opened device, captured at initialization
     */
    const gpu::DeviceCapabilities& capabilities() const { return m_capabilities; }

    const gpu::BackendOptions& options() const { return m_options; }

    /**
     * @brief Backend description ("CPU Reference Backend", "OpenCL (...)")
     */
    std::string backend_name() const;

    gpu::BackendType backend_type() const;

    /**
     * @brief Write a diagnostic line to stderr when debugging is enabled
     */
    void log_debug(const std::string& message) const;

private:
    mutable std::mutex m_mutex;
    std::unique_ptr<gpu::IComputeBackend> m_backend;
    std::atomic<bool> m_ready{false};

    gpu::BackendOptions m_options;
    gpu::DeviceCapabilities m_capabilities;
};

} // namespace cbridge
