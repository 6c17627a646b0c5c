/**
 * @file dispatch_engine.cpp
 * @brief Argument resolution, threadgroup sizing and submission
 */

#include "cbridge/bridge/dispatch_engine.h"
#include <vector>

namespace cbridge {

DispatchEngine::DispatchEngine(DeviceContext& context,
                               FunctionRegistry& functions,
                               BufferRegistry& buffers)
    : m_context(context)
    , m_functions(functions)
    , m_buffers(buffers) {}

Status DispatchEngine::run(Handle function_handle, const Grid& grid,
                           std::span<const Handle> buffer_handles) {
    if (!grid.is_valid()) {
        return make_error(ErrorKind::Dispatch, "Invalid grid dimensions " + grid.to_string());
    }

    if (!m_context.is_ready()) {
        return make_error(ErrorKind::Initialization, "Device not initialized");
    }

    auto function = m_functions.find(function_handle);
    if (!function) {
        return make_error(ErrorKind::Lookup, "Failed to retrieve function");
    }

    std::vector<std::shared_ptr<DeviceBuffer>> buffers;
    SizeT missing = m_buffers.resolve(buffer_handles, buffers);
    if (missing < buffer_handles.size()) {
        return make_error(ErrorKind::Lookup,
                          "Failed to retrieve buffer " + std::to_string(missing + 1) + "/" +
                          std::to_string(buffer_handles.size()) + " using Id " +
                          std::to_string(buffer_handles[missing]));
    }

    const UInt32 expected = function->kernel->num_args();
    if (buffers.size() != expected) {
        return make_error(ErrorKind::Dispatch, gpu::argument_count_error(expected, buffers.size()));
    }

    std::vector<gpu::IBuffer*> args;
    args.reserve(buffers.size());
    for (const auto& buffer : buffers) {
        args.push_back(buffer->memory.get());
    }

    gpu::LaunchConfig config = gpu::calculate_launch_config(
        static_cast<SizeT>(grid.width),
        static_cast<SizeT>(grid.height),
        static_cast<SizeT>(grid.depth),
        *function->kernel,
        m_context.capabilities());

    gpu::BackendResult result;
    std::string queue_error;
    {
        std::lock_guard<std::mutex> lock(function->dispatch_mutex);
        result = function->queue->submit(*function->kernel, config, args);
        if (result != gpu::BackendResult::Success) {
            queue_error = function->queue->last_error();
        }
    }

    if (result != gpu::BackendResult::Success) {
        if (queue_error.empty()) {
            queue_error = gpu::result_to_string(result);
        }
        m_context.log_debug("Dispatch of '" + function->name + "' failed: " + queue_error);
        return make_error(ErrorKind::Dispatch, queue_error);
    }

    m_context.log_debug("Ran '" + function->name + "' over " + grid.to_string() +
                        " in threadgroups of " + std::to_string(config.block_x) + "x" +
                        std::to_string(config.block_y) + "x" +
                        std::to_string(config.block_z));
    return success();
}

} // namespace cbridge
