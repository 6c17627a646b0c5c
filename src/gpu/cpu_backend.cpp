/**
 * @file cpu_backend.cpp
 * @brief CPU fallback implementation for compute backend
 *
 * This provides a reference implementation that runs on the CPU, allowing
 * the bridge to work without GPU hardware. Kernel source cannot be JIT
 * compiled here: the source is checked for a declaration of the requested
 * entry point and the work itself is done by a host function registered
 * under the same name.
 */

#include "cbridge/gpu/compute_backend.h"
#include <algorithm>
#include <cstring>
#include <mutex>
#include <new>
#include <regex>
#include <thread>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace cbridge::gpu {

namespace {

constexpr SizeT kCpuExecutionWidth = 32;
constexpr SizeT kCpuMaxWorkgroupSize = 1024;

/**
 * @brief Check that (), [] and {} are balanced
 */
bool delimiters_balanced(const std::string& source) {
    std::vector<char> stack;
    for (char c : source) {
        switch (c) {
            case '(': case '[': case '{':
                stack.push_back(c);
                break;
            case ')': case ']': case '}': {
                if (stack.empty()) return false;
                char open = stack.back();
                stack.pop_back();
                if ((c == ')' && open != '(') ||
                    (c == ']' && open != '[') ||
                    (c == '}' && open != '{')) {
                    return false;
                }
                break;
            }
            default:
                break;
        }
    }
    return stack.empty();
}

bool declares_any_kernel(const std::string& source) {
    static const std::regex pattern("(__)?kernel\\s+void\\s+[A-Za-z_][A-Za-z0-9_]*\\s*\\(");
    return std::regex_search(source, pattern);
}

} // namespace

// ============================================================================
// CPU Buffer Implementation
// ============================================================================

class CPUBuffer : public IBuffer {
public:
    explicit CPUBuffer(SizeT size)
        : m_data(new UInt8[size]())
        , m_size(size) {}

    SizeT size() const override { return m_size; }

    void* contents() override { return m_data.get(); }

private:
    std::unique_ptr<UInt8[]> m_data;
    SizeT m_size{0};
};

// ============================================================================
// CPU Kernel Implementation
// ============================================================================

class CPUKernel : public IKernel {
public:
    CPUKernel(const std::string& name, UInt32 num_args, HostKernelFunc func)
        : m_name(name), m_num_args(num_args), m_function(std::move(func)) {}

    const std::string& name() const override { return m_name; }

    SizeT preferred_workgroup_size() const override {
        return kCpuExecutionWidth;
    }

    SizeT max_workgroup_size() const override {
        return kCpuMaxWorkgroupSize;
    }

    SizeT local_memory_size() const override {
        return 0;
    }

    UInt32 num_args() const override {
        return m_num_args;
    }

    bool is_valid() const override {
        return !m_name.empty();
    }

    const HostKernelFunc& function() const { return m_function; }

private:
    std::string m_name;
    UInt32 m_num_args{0};
    HostKernelFunc m_function;
};

// ============================================================================
// CPU Queue Implementation
// ============================================================================

class CPUQueue : public IQueue {
public:
    explicit CPUQueue(UInt32 num_threads) : m_num_threads(num_threads) {}

    BackendResult submit(IKernel& kernel, const LaunchConfig& config,
                         std::span<IBuffer* const> args) override {
        m_last_error.clear();

        auto* cpu_kernel = dynamic_cast<CPUKernel*>(&kernel);
        if (!cpu_kernel || !cpu_kernel->is_valid()) {
            m_last_error = "Invalid kernel";
            return BackendResult::InvalidArgument;
        }

        if (!config.is_uniform()) {
            m_last_error = "Threadgroup size does not tile the grid";
            return BackendResult::InvalidArgument;
        }

        // Host functions index args by parameter position
        if (args.size() != cpu_kernel->num_args()) {
            m_last_error = argument_count_error(cpu_kernel->num_args(), args.size());
            return BackendResult::InvalidArgument;
        }

        const auto& func = cpu_kernel->function();
        if (!func) {
            m_last_error = "No host function registered for: " + kernel.name();
            return BackendResult::NotSupported;
        }

        std::vector<void*> arg_ptrs(args.size());
        for (SizeT i = 0; i < args.size(); ++i) {
            if (!args[i]) {
                m_last_error = "Missing buffer for argument " + std::to_string(i);
                return BackendResult::InvalidArgument;
            }
            arg_ptrs[i] = args[i]->contents();
        }

        const SizeT total_items = config.total_threads();
        const UInt32 num_args = static_cast<UInt32>(arg_ptrs.size());

        auto run_item = [&](SizeT index) {
            ThreadPosition pos;
            pos.width = config.grid_x;
            pos.height = config.grid_y;
            pos.depth = config.grid_z;
            pos.x = index % config.grid_x;
            pos.y = (index / config.grid_x) % config.grid_y;
            pos.z = index / (config.grid_x * config.grid_y);
            func(pos, arg_ptrs.data(), num_args);
        };

#ifdef _OPENMP
        // OpenMP requires signed integral type for loop variable
        #pragma omp parallel for schedule(static)
        for (Int64 omp_id = 0; omp_id < static_cast<Int64>(total_items); ++omp_id) {
            run_item(static_cast<SizeT>(omp_id));
        }
#else
        SizeT num_threads = std::min(static_cast<SizeT>(m_num_threads), total_items);
        std::vector<std::thread> threads;
        threads.reserve(num_threads);

        SizeT items_per_thread = (total_items + num_threads - 1) / num_threads;

        for (SizeT t = 0; t < num_threads; ++t) {
            SizeT start = t * items_per_thread;
            SizeT end = std::min(start + items_per_thread, total_items);

            if (start >= end) break;

            threads.emplace_back([&run_item, start, end]() {
                for (SizeT index = start; index < end; ++index) {
                    run_item(index);
                }
            });
        }

        for (auto& thread : threads) {
            thread.join();
        }
#endif

        return BackendResult::Success;
    }

    const std::string& last_error() const override {
        return m_last_error;
    }

private:
    UInt32 m_num_threads{4};
    std::string m_last_error;
};

// ============================================================================
// CPU Backend Implementation
// ============================================================================

class CPUBackend : public IComputeBackend {
public:
    CPUBackend() = default;
    ~CPUBackend() override { shutdown(); }

    // ========================================================================
    // Lifecycle
    // ========================================================================

    BackendResult initialize(const BackendOptions& options) override {
        if (m_initialized) {
            return BackendResult::Success;
        }

        if (options.device_index != 0) {
            m_last_error = "Device index out of range";
            return BackendResult::DeviceNotFound;
        }

        m_options = options;

        m_num_threads = std::thread::hardware_concurrency();
        if (m_num_threads == 0) {
            m_num_threads = 4; // Fallback
        }

        m_initialized = true;
        return BackendResult::Success;
    }

    void shutdown() override {
        m_initialized = false;
    }

    bool is_initialized() const override {
        return m_initialized;
    }

    BackendType type() const override {
        return BackendType::CPU;
    }

    const std::string& name() const override {
        static const std::string s_name = "CPU Reference Backend";
        return s_name;
    }

    // ========================================================================
    // Device Management
    // ========================================================================

    UInt32 device_count() const override {
        return 1;
    }

    DeviceCapabilities get_device_capabilities(UInt32 /*device_index*/) const override {
        DeviceCapabilities caps;

        caps.name = "CPU";
        caps.vendor = "System";
        caps.driver_version = "1.0";
        caps.device_type = DeviceType::CPU;
        caps.backend_type = BackendType::CPU;
        caps.device_id = 0;

        caps.global_memory = 8ULL * 1024 * 1024 * 1024; // Assume 8GB
        caps.max_allocation = caps.global_memory / 2;

        caps.compute_units = std::thread::hardware_concurrency();
        if (caps.compute_units == 0) caps.compute_units = 4;
        caps.warp_size = static_cast<UInt32>(kCpuExecutionWidth);

        caps.max_workgroup_size = kCpuMaxWorkgroupSize;
        caps.max_workgroup_dims[0] = kCpuMaxWorkgroupSize;
        caps.max_workgroup_dims[1] = kCpuMaxWorkgroupSize;
        caps.max_workgroup_dims[2] = 64;

        caps.supports_double = true;
        caps.supports_unified_memory = true; // CPU memory is unified

        return caps;
    }

    UInt32 current_device() const override {
        return 0;
    }

    // ========================================================================
    // Memory Management
    // ========================================================================

    std::unique_ptr<IBuffer> allocate(SizeT size) override {
        if (!m_initialized) {
            m_last_error = "Backend not initialized";
            return nullptr;
        }

        if (size == 0) {
            m_last_error = "Cannot allocate zero-size buffer";
            return nullptr;
        }

        if (size > get_device_capabilities(0).max_allocation) {
            m_last_error = "Requested size exceeds maximum allocation";
            return nullptr;
        }

        try {
            return std::make_unique<CPUBuffer>(size);
        } catch (const std::bad_alloc&) {
            m_last_error = "Failed to allocate memory";
            return nullptr;
        }
    }

    // ========================================================================
    // Kernel Management
    // ========================================================================

    std::unique_ptr<IKernel> create_kernel(const std::string& name,
                                           const std::string& source,
                                           const std::string& /*options*/) override {
        if (!m_initialized) {
            m_last_error = "Backend not initialized";
            return nullptr;
        }

        if (!delimiters_balanced(source) || !declares_any_kernel(source)) {
            m_last_error = "Failed to create library: source has no well-formed kernel declaration";
            return nullptr;
        }

        std::optional<UInt32> num_args = kernel_parameter_count(source, name);
        if (!num_args) {
            m_last_error = "Failed to find function '" + name + "'";
            return nullptr;
        }

        HostKernelFunc func;
        {
            std::lock_guard<std::mutex> lock(m_registry_mutex);
            auto it = m_kernel_registry.find(name);
            if (it != m_kernel_registry.end()) {
                func = it->second;
            }
        }

        return std::make_unique<CPUKernel>(name, *num_args, std::move(func));
    }

    std::unique_ptr<IQueue> create_queue() override {
        if (!m_initialized) {
            m_last_error = "Backend not initialized";
            return nullptr;
        }
        return std::make_unique<CPUQueue>(m_num_threads);
    }

    /**
     * @brief Register a CPU kernel function
     *
     * Kernels compiled after registration under the same name execute func.
     */
    BackendResult register_host_kernel(const std::string& name,
                                       HostKernelFunc func) override {
        if (name.empty() || !func) {
            m_last_error = "Invalid host kernel registration";
            return BackendResult::InvalidArgument;
        }

        std::lock_guard<std::mutex> lock(m_registry_mutex);
        m_kernel_registry[name] = std::move(func);
        return BackendResult::Success;
    }

    // ========================================================================
    // Error Handling
    // ========================================================================

    const std::string& last_error() const override {
        return m_last_error;
    }

    void clear_error() override {
        m_last_error.clear();
    }

    bool has_error() const override {
        return !m_last_error.empty();
    }

private:
    bool m_initialized{false};
    BackendOptions m_options;
    UInt32 m_num_threads{4};

    // Kernel registry
    std::mutex m_registry_mutex;
    std::unordered_map<std::string, HostKernelFunc> m_kernel_registry;

    // Error state
    std::string m_last_error;
};

// ============================================================================
// Backend Creator Function (called from compute_backend.cpp)
// ============================================================================

namespace detail {

std::unique_ptr<IComputeBackend> create_cpu_backend() {
    return std::make_unique<CPUBackend>();
}

} // namespace detail

} // namespace cbridge::gpu
