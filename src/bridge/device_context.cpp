/**
 * @file device_context.cpp
 * @brief Device acquisition and backend serialization
 */

#include "cbridge/bridge/device_context.h"
#include <iostream>

namespace cbridge {

DeviceContext::DeviceContext() = default;

DeviceContext::DeviceContext(std::unique_ptr<gpu::IComputeBackend> backend)
    : m_backend(std::move(backend)) {}

DeviceContext::~DeviceContext() {
    shutdown();
}

Status DeviceContext::initialize(gpu::BackendType type,
                                 const gpu::BackendOptions& options) {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (is_ready()) {
        return success();
    }

    if (!m_backend) {
        m_backend = gpu::BackendFactory::create(type);
        if (!m_backend) {
            return make_error(ErrorKind::Initialization,
                              std::string("No compatible device found for backend ") +
                              gpu::BackendFactory::type_name(type));
        }
    }

    gpu::BackendResult result = m_backend->initialize(options);
    if (result != gpu::BackendResult::Success) {
        std::string message = m_backend->last_error();
        if (message.empty()) {
            message = gpu::result_to_string(result);
        }
        if (options.enable_debugging) {
            std::cerr << "[cbridge] Device initialization failed: " << message << "\n";
        }
        return make_error(ErrorKind::Initialization, message);
    }

    m_options = options;
    m_capabilities = m_backend->get_device_capabilities(m_backend->current_device());
    m_ready.store(true, std::memory_order_release);

    if (m_options.enable_debugging) {
        std::cerr << "[cbridge] Using " << m_backend->name() << "\n"
                  << "[cbridge]   Device: " << m_capabilities.name
                  << " (" << gpu::device_type_to_string(m_capabilities.device_type) << ")\n"
                  << "[cbridge]   Max threads per threadgroup: "
                  << m_capabilities.max_workgroup_size << "\n";
    }

    return success();
}

void DeviceContext::shutdown() {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (!is_ready()) {
        return;
    }

    m_ready.store(false, std::memory_order_release);
    if (m_backend) {
        m_backend->shutdown();
    }
}

std::string DeviceContext::backend_name() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_backend ? m_backend->name() : std::string();
}

gpu::BackendType DeviceContext::backend_type() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_backend ? m_backend->type() : gpu::BackendType::Auto;
}

void DeviceContext::log_debug(const std::string& message) const {
    if (m_options.enable_debugging) {
        std::cerr << "[cbridge] " << message << "\n";
    }
}

} // namespace cbridge
