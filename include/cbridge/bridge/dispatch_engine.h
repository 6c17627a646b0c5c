#pragma once
/**
 * @file dispatch_engine.h
 * @brief Blocking compute dispatch over registered functions and buffers
 */

#include "cbridge/bridge/buffer_registry.h"
#include "cbridge/bridge/device_context.h"
#include "cbridge/bridge/function_registry.h"
#include "cbridge/bridge/result.h"
#include <limits>
#include <span>
#include <string>

namespace cbridge {

/**
 * @brief Total number of threads per dimension, one per calculation
 */
struct Grid {
    Int32 width{1};
    Int32 height{1};
    Int32 depth{1};

    /**
     * @brief Every dimension positive and the thread count representable
     */
    bool is_valid() const {
        if (width <= 0 || height <= 0 || depth <= 0) {
            return false;
        }
        const Int64 plane = static_cast<Int64>(width) * height;
        return plane <= std::numeric_limits<Int64>::max() / depth;
    }

    std::string to_string() const {
        return std::to_string(width) + "x" + std::to_string(height) + "x" +
               std::to_string(depth);
    }
};

class DispatchEngine {
public:
    DispatchEngine(DeviceContext& context,
                   FunctionRegistry& functions,
                   BufferRegistry& buffers);

    /**
     * @brief Run a function over a grid and wait for it to finish
     *
     * Buffers are bound by position: buffers[i] becomes kernel argument i,
     * and the list must supply exactly one buffer per kernel parameter.
     * Nothing is submitted unless the grid is valid and every handle
     * resolves. Registry locks are not held while the kernel executes.
     * Runs of the same function are serialized; whether runs of different
     * functions overlap on the device is up to the backend.
     *
     * @param function Handle from FunctionRegistry::compile
     * @param grid Threads per dimension; every dimension must be > 0
     * @param buffers Argument buffers in kernel parameter order
     * @return Dispatch failure for an invalid grid, a buffer count that does
     *         not match the kernel parameters or a device error,
     *         Lookup failure for an unknown function or buffer
     */
    Status run(Handle function, const Grid& grid, std::span<const Handle> buffers);

private:
    DeviceContext& m_context;
    FunctionRegistry& m_functions;
    BufferRegistry& m_buffers;
};

} // namespace cbridge
