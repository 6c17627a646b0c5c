#pragma once
/**
 * @file test_kernels.h
 * @brief Kernel sources and matching host functions shared by the tests
 *
 * The CPU reference backend cannot compile kernel source, so each kernel
 * below comes with a host function that does the same work per thread.
 */

#include "cbridge/bridge/bridge.h"
#include <cstdint>
#include <utility>

namespace cbridge::test {

inline constexpr const char* kAddSource = R"(
__kernel void add(__global const float* a,
                  __global const float* b,
                  __global float* out)
{
    size_t i = get_global_id(0);
    out[i] = a[i] + b[i];
}
)";

inline constexpr const char* kIdentitySource = R"(
__kernel void identity(__global const uchar* in,
                       __global uchar* out)
{
    size_t i = get_global_id(0);
    out[i] = in[i];
}
)";

inline constexpr const char* kIncrementSource = R"(
__kernel void increment(__global int* data)
{
    size_t i = get_global_id(0);
    data[i] = data[i] + 1;
}
)";

/// Writes dst[i] = 2 * src[i]; swapping the arguments changes the result
inline constexpr const char* kDoubleSource = R"(
__kernel void double_values(__global const int* src,
                            __global int* dst)
{
    size_t i = get_global_id(0);
    dst[i] = 2 * src[i];
}
)";

/// Stores the linear index of every thread of a 3-D grid
inline constexpr const char* kIndexSource = R"(
__kernel void linear_index(__global int* out)
{
    size_t x = get_global_id(0);
    size_t y = get_global_id(1);
    size_t z = get_global_id(2);
    size_t w = get_global_size(0);
    size_t h = get_global_size(1);
    out[(z * h + y) * w + x] = (int)((z * h + y) * w + x);
}
)";

inline config::BridgeConfig cpu_config() {
    config::BridgeConfig config = config::BridgeConfig::defaults();
    config.backend = gpu::BackendType::CPU;
    return config;
}

/**
 * @brief Register host versions of every kernel above
 *
 * A no-op on backends that compile source themselves.
 */
inline Status register_test_kernels(Bridge& bridge) {
    if (Status status = bridge.initialize(); !status) {
        return status;
    }
    if (bridge.context().backend_type() != gpu::BackendType::CPU) {
        return success();
    }

    const std::pair<const char*, gpu::HostKernelFunc> kernels[] = {
        {"add", [](const gpu::ThreadPosition& pos, void** args, UInt32) {
            const auto* a = static_cast<const float*>(args[0]);
            const auto* b = static_cast<const float*>(args[1]);
            auto* out = static_cast<float*>(args[2]);
            out[pos.x] = a[pos.x] + b[pos.x];
        }},
        {"identity", [](const gpu::ThreadPosition& pos, void** args, UInt32) {
            const auto* in = static_cast<const std::uint8_t*>(args[0]);
            auto* out = static_cast<std::uint8_t*>(args[1]);
            out[pos.x] = in[pos.x];
        }},
        {"increment", [](const gpu::ThreadPosition& pos, void** args, UInt32) {
            auto* data = static_cast<std::int32_t*>(args[0]);
            data[pos.x] = data[pos.x] + 1;
        }},
        {"double_values", [](const gpu::ThreadPosition& pos, void** args, UInt32) {
            const auto* src = static_cast<const std::int32_t*>(args[0]);
            auto* dst = static_cast<std::int32_t*>(args[1]);
            dst[pos.x] = 2 * src[pos.x];
        }},
        {"linear_index", [](const gpu::ThreadPosition& pos, void** args, UInt32) {
            auto* out = static_cast<std::int32_t*>(args[0]);
            out[pos.linear()] = static_cast<std::int32_t>(pos.linear());
        }},
    };

    for (const auto& [name, func] : kernels) {
        if (Status status = bridge.register_host_function(name, func); !status) {
            return status;
        }
    }
    return success();
}

} // namespace cbridge::test
