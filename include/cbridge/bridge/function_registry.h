#pragma once
/**
 * @file function_registry.h
 * @brief Compiled kernel pipelines addressed by integer handle
 */

#include "cbridge/bridge/device_context.h"
#include "cbridge/bridge/handle_table.h"
#include "cbridge/bridge/result.h"
#include <memory>
#include <mutex>
#include <string>

namespace cbridge {

/**
 * @brief Pipeline plus the queue it is always submitted on
 *
 * Argument bindings are mutable kernel state, so submissions of the same
 * function are serialized through dispatch_mutex.
 */
struct CompiledFunction {
    std::string name;
    std::unique_ptr<gpu::IKernel> kernel;
    std::unique_ptr<gpu::IQueue> queue;
    std::mutex dispatch_mutex;
};

class FunctionRegistry {
public:
    explicit FunctionRegistry(DeviceContext& context);

    FunctionRegistry(const FunctionRegistry&) = delete;
    FunctionRegistry& operator=(const FunctionRegistry&) = delete;

    /**
     * @brief Compile source, look up entry_point and give it a dedicated queue
     *
     * Identical arguments compile to a new, distinct handle every time.
     * @return Handle, or a Compilation failure ("Missing kernel source",
     *         "Missing function name", "Failed to create library: ...",
     *         "Failed to find function '...'", "Failed to set up command queue")
     */
    Result<Handle> compile(const std::string& source, const std::string& entry_point);

    /**
     * @brief Entry point name the function was compiled for
     */
    Result<std::string> name(Handle handle) const;

    std::shared_ptr<CompiledFunction> find(Handle handle) const;

    /**
     * @brief Drop the function; its handle is never issued again
     */
    Status release(Handle handle);

    bool contains(Handle handle) const { return m_table.contains(handle); }

    SizeT size() const { return m_table.size(); }

    void clear() { m_table.clear(); }

private:
    DeviceContext& m_context;
    HandleTable<CompiledFunction> m_table;
};

} // namespace cbridge
