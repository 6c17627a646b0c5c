/**
 * @file function_registry.cpp
 * @brief Kernel compilation and pipeline bookkeeping
 */

#include "cbridge/bridge/function_registry.h"

namespace cbridge {

namespace {

std::string unknown_function(Handle handle) {
    return "Failed to retrieve function using Id " + std::to_string(handle);
}

} // anonymous namespace

FunctionRegistry::FunctionRegistry(DeviceContext& context)
    : m_context(context) {}

Result<Handle> FunctionRegistry::compile(const std::string& source,
                                         const std::string& entry_point) {
    if (source.empty()) {
        return make_error(ErrorKind::Compilation, "Missing kernel source");
    }
    if (entry_point.empty()) {
        return make_error(ErrorKind::Compilation, "Missing function name");
    }

    auto function = std::make_shared<CompiledFunction>();
    function->name = entry_point;

    std::string build_error;
    std::string queue_error;

    bool ready = m_context.with_backend([&](gpu::IComputeBackend& backend) {
        backend.clear_error();
        function->kernel = backend.create_kernel(entry_point, source,
                                                 m_context.options().compiler_options);
        if (!function->kernel) {
            build_error = backend.last_error();
            return;
        }

        function->queue = backend.create_queue();
        if (!function->queue) {
            queue_error = backend.last_error();
        }
    });

    if (!ready) {
        return make_error(ErrorKind::Initialization, "Device not initialized");
    }

    if (!function->kernel) {
        return make_error(ErrorKind::Compilation,
                          build_error.empty() ? "Failed to create library" : build_error);
    }

    if (!function->queue) {
        m_context.log_debug("Command queue creation failed: " + queue_error);
        return make_error(ErrorKind::Compilation, "Failed to set up command queue");
    }

    Handle handle = m_table.insert(function);
    if (handle == kInvalidHandle) {
        return make_error(ErrorKind::Compilation, "Function handles exhausted");
    }

    m_context.log_debug("Compiled function '" + entry_point + "' as Id " +
                        std::to_string(handle) + " (execution width " +
                        std::to_string(function->kernel->preferred_workgroup_size()) +
                        ", max threads " +
                        std::to_string(function->kernel->max_workgroup_size()) + ")");
    return handle;
}

Result<std::string> FunctionRegistry::name(Handle handle) const {
    auto function = m_table.find(handle);
    if (!function) {
        return make_error(ErrorKind::Lookup, unknown_function(handle));
    }
    return function->name;
}

std::shared_ptr<CompiledFunction> FunctionRegistry::find(Handle handle) const {
    return m_table.find(handle);
}

Status FunctionRegistry::release(Handle handle) {
    auto function = m_table.erase(handle);
    if (!function) {
        return make_error(ErrorKind::Lookup, unknown_function(handle));
    }

    // Wait for an in-flight dispatch on this function to drain
    std::lock_guard<std::mutex> lock(function->dispatch_mutex);
    m_context.log_debug("Released function Id " + std::to_string(handle));
    return success();
}

} // namespace cbridge
