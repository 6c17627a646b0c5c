/**
 * @file main.cpp
 * @brief Element-wise vector addition example
 *
 * Runs out[i] = a[i] + b[i] on the best available device. On the CPU
 * reference backend the kernel body is supplied as a host function.
 */

#include "cbridge/cbridge.h"
#include <iostream>
#include <iomanip>

namespace {

const char* kAddSource = R"(
__kernel void add(__global const float* a,
                  __global const float* b,
                  __global float* out)
{
    size_t i = get_global_id(0);
    out[i] = a[i] + b[i];
}
)";

constexpr int kCount = 1024;

} // anonymous namespace

int main() {
    std::cout << "ComputeBridge Vector Add Example\n";
    std::cout << "Version: " << cbridge::GetVersionString() << "\n\n";

    cbridge::Bridge bridge;
    if (auto status = bridge.initialize(); !status) {
        std::cerr << status.error() << "\n";
        return 1;
    }

    std::cout << "Backend: " << bridge.context().backend_name() << "\n";

    if (bridge.context().backend_type() == cbridge::gpu::BackendType::CPU) {
        auto status = bridge.register_host_function("add",
            [](const cbridge::gpu::ThreadPosition& pos, void** args, cbridge::UInt32) {
                const auto* a = static_cast<const float*>(args[0]);
                const auto* b = static_cast<const float*>(args[1]);
                auto* out = static_cast<float*>(args[2]);
                out[pos.x] = a[pos.x] + b[pos.x];
            });
        if (!status) {
            std::cerr << status.error() << "\n";
            return 1;
        }
    }

    auto function = bridge.compile(kAddSource, "add");
    if (!function) {
        std::cerr << function.error() << "\n";
        return 1;
    }

    auto a = cbridge::new_buffer<float>(bridge, kCount);
    auto b = cbridge::new_buffer<float>(bridge, kCount);
    auto out = cbridge::new_buffer<float>(bridge, kCount);
    if (!a || !b || !out) {
        std::cerr << "Unable to allocate buffers\n";
        return 1;
    }

    for (int i = 0; i < kCount; ++i) {
        a.value()[i] = static_cast<float>(i);
        b.value()[i] = static_cast<float>(kCount - i) * 0.5f;
    }

    auto status = bridge.run(function.value(), {kCount, 1, 1},
                             {a.value().handle(), b.value().handle(), out.value().handle()});
    if (!status) {
        std::cerr << status.error() << "\n";
        return 1;
    }

    std::cout << std::fixed << std::setprecision(1);
    for (int i = 0; i < 4; ++i) {
        std::cout << "  " << a.value()[i] << " + " << b.value()[i]
                  << " = " << out.value()[i] << "\n";
    }
    std::cout << "  ...\n";

    int mismatches = 0;
    for (int i = 0; i < kCount; ++i) {
        if (out.value()[i] != a.value()[i] + b.value()[i]) {
            ++mismatches;
        }
    }
    std::cout << "\n" << (mismatches == 0 ? "All results correct" : "Results differ")
              << " (" << kCount << " elements)\n";

    bridge.shutdown();
    return mismatches == 0 ? 0 : 1;
}
