/**
 * @file compute_backend.cpp
 * @brief Backend factory and utility implementations
 */

#include "cbridge/gpu/compute_backend.h"
#include <algorithm>
#include <cctype>
#include <mutex>
#include <regex>

namespace cbridge::gpu {

// ============================================================================
// Backend Factory Implementation
// ============================================================================

std::unordered_map<BackendType, BackendFactory::CreatorFunc>& BackendFactory::registry() {
    static std::unordered_map<BackendType, CreatorFunc> s_registry;
    return s_registry;
}

void BackendFactory::register_backend(BackendType type, CreatorFunc creator) {
    static std::mutex s_mutex;
    std::lock_guard<std::mutex> lock(s_mutex);
    registry()[type] = std::move(creator);
}

std::unique_ptr<IComputeBackend> BackendFactory::create(BackendType type) {
    register_builtin_backends();

    if (type == BackendType::Auto) {
        return create_best_available();
    }

    auto& reg = registry();
    auto it = reg.find(type);
    if (it != reg.end() && it->second) {
        return it->second();
    }
    return nullptr;
}

std::unique_ptr<IComputeBackend> BackendFactory::create_best_available() {
    static const BackendType priority[] = {
        BackendType::OpenCL,
        BackendType::CPU
    };

    for (auto type : priority) {
        if (is_available(type)) {
            auto backend = create(type);
            if (backend) {
                return backend;
            }
        }
    }

    return nullptr;
}

std::vector<BackendType> BackendFactory::available_backends() {
    register_builtin_backends();

    std::vector<BackendType> result;
    result.reserve(registry().size());

    for (const auto& [type, creator] : registry()) {
        if (creator) {
            result.push_back(type);
        }
    }

    return result;
}

bool BackendFactory::is_available(BackendType type) {
    register_builtin_backends();

    if (type == BackendType::Auto) {
        return !registry().empty();
    }

    auto& reg = registry();
    auto it = reg.find(type);
    return it != reg.end() && it->second != nullptr;
}

const char* BackendFactory::type_name(BackendType type) {
    switch (type) {
        case BackendType::CPU:     return "CPU";
        case BackendType::OpenCL:  return "OpenCL";
        case BackendType::Auto:    return "Auto";
        default:                   return "Unknown";
    }
}

BackendType BackendFactory::parse_type(const std::string& name) {
    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "cpu") return BackendType::CPU;
    if (lowered == "opencl") return BackendType::OpenCL;
    return BackendType::Auto;
}

// ============================================================================
// Utility Function Implementations
// ============================================================================

const char* result_to_string(BackendResult result) {
    switch (result) {
        case BackendResult::Success:           return "Success";
        case BackendResult::DeviceNotFound:    return "Device not found";
        case BackendResult::OutOfMemory:       return "Out of memory";
        case BackendResult::InvalidArgument:   return "Invalid argument";
        case BackendResult::CompilationFailed: return "Compilation failed";
        case BackendResult::FunctionNotFound:  return "Function not found";
        case BackendResult::LaunchFailed:      return "Launch failed";
        case BackendResult::SyncFailed:        return "Synchronization failed";
        case BackendResult::NotInitialized:    return "Not initialized";
        case BackendResult::NotSupported:      return "Not supported";
        case BackendResult::InternalError:     return "Internal error";
        default:                               return "Unknown error";
    }
}

const char* device_type_to_string(DeviceType type) {
    switch (type) {
        case DeviceType::Unknown:       return "Unknown";
        case DeviceType::CPU:           return "CPU";
        case DeviceType::DiscreteGPU:   return "Discrete GPU";
        case DeviceType::IntegratedGPU: return "Integrated GPU";
        case DeviceType::Accelerator:   return "Accelerator";
        default:                        return "Unknown";
    }
}

namespace {

// Largest divisor of n not above limit, preferring multiples of `multiple`.
SizeT largest_divisor(SizeT n, SizeT limit, SizeT multiple = 1) {
    limit = std::max<SizeT>(1, std::min(n, limit));

    if (multiple > 1) {
        for (SizeT d = limit - limit % multiple; d >= multiple; d -= multiple) {
            if (n % d == 0) return d;
        }
    }

    for (SizeT d = limit; d > 1; --d) {
        if (n % d == 0) return d;
    }
    return 1;
}

SizeT dimension_limit(const DeviceCapabilities& caps, int dim, SizeT fallback) {
    return caps.max_workgroup_dims[dim] > 0
        ? static_cast<SizeT>(caps.max_workgroup_dims[dim])
        : fallback;
}

} // namespace

LaunchConfig calculate_launch_config(SizeT width, SizeT height, SizeT depth,
                                     const IKernel& kernel,
                                     const DeviceCapabilities& caps) {
    LaunchConfig config;
    config.grid_x = std::max<SizeT>(1, width);
    config.grid_y = std::max<SizeT>(1, height);
    config.grid_z = std::max<SizeT>(1, depth);

    // Threads per group may not exceed either the pipeline or the device
    SizeT max_total = kernel.max_workgroup_size();
    if (caps.max_workgroup_size > 0) {
        max_total = max_total > 0 ? std::min(max_total, caps.max_workgroup_size)
                                  : caps.max_workgroup_size;
    }
    max_total = std::max<SizeT>(1, max_total);

    SizeT execution_width = std::max<SizeT>(1, kernel.preferred_workgroup_size());

    config.block_x = largest_divisor(config.grid_x,
                                     std::min(max_total, dimension_limit(caps, 0, max_total)),
                                     execution_width);

    SizeT remaining = max_total / config.block_x;
    config.block_y = largest_divisor(config.grid_y,
                                     std::min(remaining, dimension_limit(caps, 1, remaining)));

    remaining /= config.block_y;
    config.block_z = largest_divisor(config.grid_z,
                                     std::min(remaining, dimension_limit(caps, 2, remaining)));

    return config;
}

std::optional<UInt32> kernel_parameter_count(const std::string& source,
                                             const std::string& name) {
    static const std::regex identifier("[A-Za-z_][A-Za-z0-9_]*");
    if (!std::regex_match(name, identifier)) {
        return std::nullopt;
    }

    const std::regex declaration("(__)?kernel\\s+void\\s+" + name + "\\s*\\(");
    std::smatch match;
    if (!std::regex_search(source, match, declaration)) {
        return std::nullopt;
    }

    // Walk the parameter list up to its closing parenthesis, counting
    // top-level commas
    const SizeT open = static_cast<SizeT>(match.position(0) + match.length(0));
    SizeT depth = 0;
    UInt32 separators = 0;
    SizeT pos = open;
    for (; pos < source.size(); ++pos) {
        char c = source[pos];
        if (c == '(' || c == '[' || c == '{') {
            ++depth;
        } else if (c == ')' || c == ']' || c == '}') {
            if (depth == 0) break;
            --depth;
        } else if (c == ',' && depth == 0) {
            ++separators;
        }
    }

    if (pos == source.size()) {
        return std::nullopt;
    }

    std::string params = source.substr(open, pos - open);
    params.erase(std::remove_if(params.begin(), params.end(),
                                [](unsigned char c) { return std::isspace(c) != 0; }),
                 params.end());
    if (params.empty() || params == "void") {
        return 0u;
    }
    return separators + 1;
}

std::string argument_count_error(UInt32 expected, SizeT bound) {
    return "Expected " + std::to_string(expected) + " buffers, got " + std::to_string(bound);
}

// Forward declarations of backend creators
namespace detail {

// CPU backend (always available)
std::unique_ptr<IComputeBackend> create_cpu_backend();

#ifdef CBRIDGE_HAS_OPENCL
// OpenCL backend (defined in opencl/opencl_backend.cpp)
std::unique_ptr<IComputeBackend> create_opencl_backend();
bool is_opencl_available();
#endif

} // namespace detail

void register_builtin_backends() {
    static std::once_flag s_registered;
    std::call_once(s_registered, [] {
        BackendFactory::register_backend(BackendType::CPU, detail::create_cpu_backend);

#ifdef CBRIDGE_HAS_OPENCL
        if (detail::is_opencl_available()) {
            BackendFactory::register_backend(BackendType::OpenCL, detail::create_opencl_backend);
        }
#endif
    });
}

} // namespace cbridge::gpu
