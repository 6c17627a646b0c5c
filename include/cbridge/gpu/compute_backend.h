#pragma once
/**
 * @file compute_backend.h
 * @brief Compute backend abstraction used by the handle registries
 *
 * The backend is the black-box capability provider behind the bridge. It
 * knows how to:
 * - Enumerate and open one device
 * - Allocate device-visible memory with a stable host view
 * - Compile kernel source into an executable pipeline
 * - Create command queues and submit a compute pass, blocking until done
 *
 * Implementations:
 * - OpenCL (cross-platform, compiled when CBRIDGE_HAS_OPENCL is defined)
 * - CPU (reference implementation executing registered host functions)
 *
 * Backends never hand out integer ids. Every native object is returned as an
 * owning C++ object (IBuffer, IKernel, IQueue) and the registries decide how
 * callers refer to it.
 *
 * Usage:
 * @code
 * auto backend = BackendFactory::create(BackendType::Auto);
 * backend->initialize();
 *
 * auto kernel = backend->create_kernel("add", source);
 * auto queue  = backend->create_queue();
 * auto a      = backend->allocate(sizeof(float) * n);
 *
 * auto config = calculate_launch_config(n, 1, 1, *kernel,
 *                                       backend->get_device_capabilities());
 * IBuffer* args[] = {a.get()};
 * queue->submit(*kernel, config, args);
 * @endcode
 */

#include "cbridge/core/types.h"
#include <string>
#include <memory>
#include <vector>
#include <functional>
#include <unordered_map>
#include <optional>
#include <span>

namespace cbridge::gpu {

// ============================================================================
// Enumerations
// ============================================================================

/**
 * @brief Supported compute backend types
 */
enum class BackendType : UInt8 {
    CPU     = 0,    ///< CPU reference implementation (always available)
    OpenCL  = 2,    ///< OpenCL (cross-platform)
    Auto    = 255   ///< Automatic selection (best available)
};

/**
 * @brief Backend operation result
 */
enum class BackendResult : UInt8 {
    Success             = 0,
    DeviceNotFound      = 1,
    OutOfMemory         = 2,
    InvalidArgument     = 3,
    CompilationFailed   = 4,
    FunctionNotFound    = 5,
    LaunchFailed        = 6,
    SyncFailed          = 7,
    NotInitialized      = 8,
    NotSupported        = 9,
    InternalError       = 255
};

/**
 * @brief Device type classification
 */
enum class DeviceType : UInt8 {
    Unknown         = 0,
    CPU             = 1,
    DiscreteGPU     = 2,
    IntegratedGPU   = 3,
    Accelerator     = 4
};

// ============================================================================
// Configuration Structures
// ============================================================================

/**
 * @brief Compute pass launch configuration
 *
 * grid_* is the total number of threads per dimension (one thread per
 * calculation). block_* is the threadgroup shape; each block dimension
 * divides the matching grid dimension.
 */
struct LaunchConfig {
    SizeT grid_x{1};
    SizeT grid_y{1};
    SizeT grid_z{1};

    SizeT block_x{1};
    SizeT block_y{1};
    SizeT block_z{1};

    SizeT total_threads() const {
        return grid_x * grid_y * grid_z;
    }

    SizeT threads_per_group() const {
        return block_x * block_y * block_z;
    }

    SizeT group_count() const {
        return (grid_x / block_x) * (grid_y / block_y) * (grid_z / block_z);
    }

    /**
     * @brief Check that the threadgroup shape evenly tiles the grid
     */
    bool is_uniform() const {
        return block_x > 0 && block_y > 0 && block_z > 0 &&
               grid_x % block_x == 0 &&
               grid_y % block_y == 0 &&
               grid_z % block_z == 0;
    }
};

/**
 * @brief Device capabilities and properties
 */
struct DeviceCapabilities {
    // Identification
    std::string name;
    std::string vendor;
    std::string driver_version;
    DeviceType device_type{DeviceType::Unknown};
    BackendType backend_type{BackendType::CPU};
    UInt32 device_id{0};

    // Memory
    SizeT global_memory{0};         ///< Total global memory (bytes)
    SizeT max_allocation{0};        ///< Maximum single allocation (bytes)

    // Compute units
    UInt32 compute_units{0};
    UInt32 warp_size{0};            ///< Warp/wavefront size

    // Limits
    SizeT max_workgroup_size{0};            ///< Maximum threads per threadgroup
    UInt32 max_workgroup_dims[3]{0, 0, 0};  ///< Per-dimension threadgroup limits

    // Features
    bool supports_double{false};
    bool supports_unified_memory{false};
};

/**
 * @brief Backend initialization options
 */
struct BackendOptions {
    UInt32 device_index{0};         ///< Device to open (only one is ever used)
    bool enable_profiling{false};   ///< Create queues with profiling enabled
    bool enable_debugging{false};   ///< Write diagnostics to stderr
    std::string compiler_options;   ///< Extra kernel build options
};

// ============================================================================
// Host Kernels (CPU backend)
// ============================================================================

/**
 * @brief Position of one thread inside the dispatched grid
 */
struct ThreadPosition {
    SizeT x{0};
    SizeT y{0};
    SizeT z{0};

    SizeT width{1};
    SizeT height{1};
    SizeT depth{1};

    SizeT linear() const {
        return (z * height + y) * width + x;
    }
};

/**
 * @brief Host function standing in for a kernel on the CPU backend
 *
 * args[i] is the host view of the buffer bound at argument index i.
 */
using HostKernelFunc = std::function<void(
    const ThreadPosition& position,
    void** args,
    UInt32 num_args
)>;

// ============================================================================
// Native Object Interfaces
// ============================================================================

/**
 * @brief Device-visible memory block with a stable host view
 */
class IBuffer {
public:
    virtual ~IBuffer() = default;

    /**
     * @brief Size in bytes
     */
    virtual SizeT size() const = 0;

    /**
     * @brief Host-addressable view, valid for the lifetime of the buffer
     */
    virtual void* contents() = 0;
};

/**
 * @brief Compiled compute pipeline
 */
class IKernel {
public:
    virtual ~IKernel() = default;

    /**
     * @brief Entry point name
     */
    virtual const std::string& name() const = 0;

    /**
     * @brief Hardware-reported execution width (warp / SIMD group size)
     */
    virtual SizeT preferred_workgroup_size() const = 0;

    /**
     * @brief Maximum threads per threadgroup for this pipeline
     */
    virtual SizeT max_workgroup_size() const = 0;

    virtual SizeT local_memory_size() const = 0;

    /**
     * @brief Number of parameters the entry point declares
     *
     * A submission must bind exactly this many buffers.
     */
    virtual UInt32 num_args() const = 0;

    virtual bool is_valid() const = 0;
};

/**
 * @brief Ordered submission channel between host and device
 *
 * A queue is not safe for concurrent submission. Callers serialize access.
 */
class IQueue {
public:
    virtual ~IQueue() = default;

    /**
     * @brief Bind arguments, run one compute pass and wait for completion
     * @param kernel Pipeline to run
     * @param config Grid and threadgroup shape
     * @param args Buffers bound by position: args[i] is kernel argument i
     * @return Success or error code; details in last_error()
     */
    virtual BackendResult submit(IKernel& kernel,
                                 const LaunchConfig& config,
                                 std::span<IBuffer* const> args) = 0;

    virtual const std::string& last_error() const = 0;
};

// ============================================================================
// Compute Backend Interface
// ============================================================================

/**
 * @brief Abstract interface for compute backends
 *
 * Backend methods are not thread-safe; DeviceContext serializes them. Objects
 * returned by a backend may be used after the call that created them returns,
 * but must be destroyed before shutdown().
 */
class IComputeBackend {
public:
    virtual ~IComputeBackend() = default;

    // ========================================================================
    // Lifecycle
    // ========================================================================

    /**
     * @brief Initialize the backend (idempotent)
     */
    virtual BackendResult initialize(const BackendOptions& options = {}) = 0;

    virtual void shutdown() = 0;

    virtual bool is_initialized() const = 0;

    virtual BackendType type() const = 0;

    /**
     * @brief Backend name (e.g., "OpenCL (gfx1030, OpenCL 2.0)")
     */
    virtual const std::string& name() const = 0;

    // ========================================================================
    // Device Management
    // ========================================================================

    virtual UInt32 device_count() const = 0;

    virtual DeviceCapabilities get_device_capabilities(UInt32 device_index = 0) const = 0;

    virtual UInt32 current_device() const = 0;

    // ========================================================================
    // Memory Management
    // ========================================================================

    /**
     * @brief Allocate device-visible memory
     * @return Buffer or nullptr on failure (see last_error())
     */
    virtual std::unique_ptr<IBuffer> allocate(SizeT size) = 0;

    // ========================================================================
    // Kernel Management
    // ========================================================================

    /**
     * @brief Compile source and look up the named entry point
     * @param name Kernel function name
     * @param source Kernel source code
     * @param options Compiler options (e.g., "-DDEBUG")
     * @return Kernel or nullptr on failure (see last_error())
     */
    virtual std::unique_ptr<IKernel> create_kernel(
        const std::string& name,
        const std::string& source,
        const std::string& options = "") = 0;

    /**
     * @brief Create a dedicated command queue
     * @return Queue or nullptr on failure (see last_error())
     */
    virtual std::unique_ptr<IQueue> create_queue() = 0;

    /**
     * @brief Register a host function to execute for a kernel name
     *
     * Only meaningful for the CPU backend.
     */
    virtual BackendResult register_host_kernel(const std::string& /*name*/,
                                               HostKernelFunc /*func*/) {
        return BackendResult::NotSupported;
    }

    // ========================================================================
    // Error Handling
    // ========================================================================

    virtual const std::string& last_error() const = 0;

    virtual void clear_error() = 0;

    virtual bool has_error() const = 0;
};

// ============================================================================
// Backend Factory
// ============================================================================

/**
 * @brief Factory for creating compute backends
 */
class BackendFactory {
public:
    /**
     * @brief Create a compute backend of the specified type
     * @return Backend instance or nullptr if not available
     */
    static std::unique_ptr<IComputeBackend> create(BackendType type);

    /**
     * @brief Create the best available backend
     *
     * Priority: OpenCL > CPU
     */
    static std::unique_ptr<IComputeBackend> create_best_available();

    static std::vector<BackendType> available_backends();

    static bool is_available(BackendType type);

    static const char* type_name(BackendType type);

    /**
     * @brief Parse a backend name ("cpu", "opencl", "auto"), case-insensitive
     * @return Parsed type, or Auto for unknown names
     */
    static BackendType parse_type(const std::string& name);

    using CreatorFunc = std::function<std::unique_ptr<IComputeBackend>()>;
    static void register_backend(BackendType type, CreatorFunc creator);

private:
    static std::unordered_map<BackendType, CreatorFunc>& registry();
};

// ============================================================================
// Utility Functions
// ============================================================================

const char* result_to_string(BackendResult result);

const char* device_type_to_string(DeviceType type);

/**
 * @brief Choose a threadgroup shape for a width x height x depth grid
 *
 * Each threadgroup dimension evenly divides the grid dimension and respects
 * the device per-dimension limit; the product respects both the pipeline and
 * the device maximum. The x dimension is sized first and prefers multiples of
 * the pipeline's execution width.
 */
LaunchConfig calculate_launch_config(SizeT width, SizeT height, SizeT depth,
                                     const IKernel& kernel,
                                     const DeviceCapabilities& caps);

/**
 * @brief Count the parameters of `kernel void name(...)` in source
 * @return Parameter count, or std::nullopt if source does not declare name
 */
std::optional<UInt32> kernel_parameter_count(const std::string& source,
                                             const std::string& name);

/**
 * @brief Message reported when a submission binds the wrong number of buffers
 */
std::string argument_count_error(UInt32 expected, SizeT bound);

/**
 * @brief Register all built-in backends (safe to call repeatedly)
 */
void register_builtin_backends();

} // namespace cbridge::gpu
