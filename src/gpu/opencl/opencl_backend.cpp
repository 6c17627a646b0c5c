/**
 * @file opencl_backend.cpp
 * @brief OpenCL implementation of IComputeBackend
 *
 * Cross-platform GPU execution for the bridge. It supports:
 * - AMD GPUs (ROCm/AMDGPU-PRO)
 * - Intel GPUs (NEO driver)
 * - NVIDIA GPUs (via NVIDIA OpenCL driver)
 * - Intel/AMD CPUs (via OpenCL CPU runtimes)
 *
 * Buffers keep a host shadow copy which is the stable view handed to
 * callers. Each submission uploads the shadows of the bound buffers, runs the
 * kernel and downloads them again on the same in-order queue, then waits for
 * the queue to drain. Kernel writes are therefore visible through the view as
 * soon as submit() returns.
 *
 * Uploads and downloads cover every bound buffer, so two submissions sharing
 * a buffer on different queues could overwrite each other's results. All
 * queues of a backend share one submit lock and run one pass at a time.
 *
 * Requirements:
 * - OpenCL 1.2 or later runtime
 * - OpenCL ICD (Installable Client Driver) loader
 */

#include "cbridge/gpu/compute_backend.h"

#ifdef CBRIDGE_HAS_OPENCL

#define CL_TARGET_OPENCL_VERSION 120
#define CL_USE_DEPRECATED_OPENCL_1_2_APIS

#ifdef __APPLE__
#include <OpenCL/opencl.h>
#else
#include <CL/cl.h>
#endif

#include <algorithm>
#include <cstring>
#include <memory>
#include <mutex>
#include <new>
#include <vector>

namespace cbridge::gpu {

// ============================================================================
// OpenCL Error Checking Utilities
// ============================================================================

static const char* opencl_error_string(cl_int error) {
    switch (error) {
        case CL_SUCCESS:                         return "Success";
        case CL_DEVICE_NOT_FOUND:               return "Device not found";
        case CL_DEVICE_NOT_AVAILABLE:           return "Device not available";
        case CL_COMPILER_NOT_AVAILABLE:         return "Compiler not available";
        case CL_MEM_OBJECT_ALLOCATION_FAILURE:  return "Memory object allocation failure";
        case CL_OUT_OF_RESOURCES:               return "Out of resources";
        case CL_OUT_OF_HOST_MEMORY:             return "Out of host memory";
        case CL_BUILD_PROGRAM_FAILURE:          return "Build program failure";
        case CL_MAP_FAILURE:                    return "Map failure";
        case CL_INVALID_VALUE:                  return "Invalid value";
        case CL_INVALID_DEVICE_TYPE:            return "Invalid device type";
        case CL_INVALID_PLATFORM:               return "Invalid platform";
        case CL_INVALID_DEVICE:                 return "Invalid device";
        case CL_INVALID_CONTEXT:                return "Invalid context";
        case CL_INVALID_QUEUE_PROPERTIES:       return "Invalid queue properties";
        case CL_INVALID_COMMAND_QUEUE:          return "Invalid command queue";
        case CL_INVALID_HOST_PTR:               return "Invalid host pointer";
        case CL_INVALID_MEM_OBJECT:             return "Invalid memory object";
        case CL_INVALID_BINARY:                 return "Invalid binary";
        case CL_INVALID_BUILD_OPTIONS:          return "Invalid build options";
        case CL_INVALID_PROGRAM:                return "Invalid program";
        case CL_INVALID_PROGRAM_EXECUTABLE:     return "Invalid program executable";
        case CL_INVALID_KERNEL_NAME:            return "Invalid kernel name";
        case CL_INVALID_KERNEL_DEFINITION:      return "Invalid kernel definition";
        case CL_INVALID_KERNEL:                 return "Invalid kernel";
        case CL_INVALID_ARG_INDEX:              return "Invalid argument index";
        case CL_INVALID_ARG_VALUE:              return "Invalid argument value";
        case CL_INVALID_ARG_SIZE:               return "Invalid argument size";
        case CL_INVALID_KERNEL_ARGS:            return "Invalid kernel arguments";
        case CL_INVALID_WORK_DIMENSION:         return "Invalid work dimension";
        case CL_INVALID_WORK_GROUP_SIZE:        return "Invalid work group size";
        case CL_INVALID_WORK_ITEM_SIZE:         return "Invalid work item size";
        case CL_INVALID_GLOBAL_OFFSET:          return "Invalid global offset";
        case CL_INVALID_EVENT_WAIT_LIST:        return "Invalid event wait list";
        case CL_INVALID_EVENT:                  return "Invalid event";
        case CL_INVALID_OPERATION:              return "Invalid operation";
        case CL_INVALID_BUFFER_SIZE:            return "Invalid buffer size";
        case CL_INVALID_GLOBAL_WORK_SIZE:       return "Invalid global work size";
        default:                                return "Unknown OpenCL error";
    }
}

static std::string format_opencl_error(cl_int err, const char* context) {
    return std::string(context) + ": " + opencl_error_string(err);
}

static cl_command_queue create_command_queue(cl_context context, cl_device_id device,
                                             bool profiling, cl_int* err) {
    cl_command_queue_properties props = 0;
    if (profiling) {
        props |= CL_QUEUE_PROFILING_ENABLE;
    }
    return clCreateCommandQueue(context, device, props, err);
}

// ============================================================================
// OpenCL Buffer Implementation
// ============================================================================

class OpenCLBuffer : public IBuffer {
public:
    OpenCLBuffer(cl_mem mem, std::unique_ptr<UInt8[]> shadow, SizeT size)
        : m_mem(mem), m_shadow(std::move(shadow)), m_size(size) {}

    ~OpenCLBuffer() override {
        if (m_mem) {
            clReleaseMemObject(m_mem);
        }
    }

    OpenCLBuffer(const OpenCLBuffer&) = delete;
    OpenCLBuffer& operator=(const OpenCLBuffer&) = delete;

    SizeT size() const override { return m_size; }

    void* contents() override { return m_shadow.get(); }

    cl_mem mem() const { return m_mem; }

private:
    cl_mem m_mem{nullptr};
    std::unique_ptr<UInt8[]> m_shadow;
    SizeT m_size{0};
};

// ============================================================================
// OpenCL Kernel Implementation
// ============================================================================

/**
 * @brief OpenCL kernel wrapper implementing IKernel interface
 *
 * Owns both the kernel and the program it was built from.
 */
class OpenCLKernel : public IKernel {
public:
    OpenCLKernel(const std::string& name, cl_kernel kernel, cl_program program,
                 cl_device_id device)
        : m_name(name)
        , m_kernel(kernel)
        , m_program(program)
        , m_device(device)
    {
        query_kernel_attributes();
    }

    ~OpenCLKernel() override {
        if (m_kernel) {
            clReleaseKernel(m_kernel);
        }
        if (m_program) {
            clReleaseProgram(m_program);
        }
    }

    OpenCLKernel(const OpenCLKernel&) = delete;
    OpenCLKernel& operator=(const OpenCLKernel&) = delete;

    const std::string& name() const override { return m_name; }

    SizeT preferred_workgroup_size() const override {
        return m_preferred_workgroup_size;
    }

    SizeT max_workgroup_size() const override {
        return m_max_workgroup_size;
    }

    SizeT local_memory_size() const override {
        return m_local_mem_size;
    }

    UInt32 num_args() const override {
        return m_num_args;
    }

    bool is_valid() const override {
        return m_kernel != nullptr;
    }

    cl_kernel kernel() const { return m_kernel; }

private:
    void query_kernel_attributes() {
        if (!m_kernel || !m_device) return;

        size_t wg_size = 0;
        if (clGetKernelWorkGroupInfo(m_kernel, m_device,
                                     CL_KERNEL_WORK_GROUP_SIZE,
                                     sizeof(wg_size), &wg_size, nullptr) == CL_SUCCESS &&
            wg_size > 0) {
            m_max_workgroup_size = static_cast<SizeT>(wg_size);
        }

        size_t preferred = 0;
        if (clGetKernelWorkGroupInfo(m_kernel, m_device,
                                     CL_KERNEL_PREFERRED_WORK_GROUP_SIZE_MULTIPLE,
                                     sizeof(preferred), &preferred, nullptr) == CL_SUCCESS &&
            preferred > 0) {
            m_preferred_workgroup_size = static_cast<SizeT>(preferred);
        }

        cl_uint num_args = 0;
        if (clGetKernelInfo(m_kernel, CL_KERNEL_NUM_ARGS,
                            sizeof(num_args), &num_args, nullptr) == CL_SUCCESS) {
            m_num_args = static_cast<UInt32>(num_args);
        }

        cl_ulong local_mem = 0;
        if (clGetKernelWorkGroupInfo(m_kernel, m_device,
                                     CL_KERNEL_LOCAL_MEM_SIZE,
                                     sizeof(local_mem), &local_mem, nullptr) == CL_SUCCESS) {
            m_local_mem_size = static_cast<SizeT>(local_mem);
        }
    }

    std::string m_name;
    cl_kernel m_kernel{nullptr};
    cl_program m_program{nullptr};
    cl_device_id m_device{nullptr};

    // Kernel attributes
    SizeT m_max_workgroup_size{256};
    SizeT m_preferred_workgroup_size{32};
    SizeT m_local_mem_size{0};
    UInt32 m_num_args{0};
};

// ============================================================================
// OpenCL Queue Implementation
// ============================================================================

class OpenCLQueue : public IQueue {
public:
    OpenCLQueue(cl_command_queue queue, std::shared_ptr<std::mutex> submit_mutex)
        : m_queue(queue), m_submit_mutex(std::move(submit_mutex)) {}

    ~OpenCLQueue() override {
        if (m_queue) {
            clFinish(m_queue);
            clReleaseCommandQueue(m_queue);
        }
    }

    OpenCLQueue(const OpenCLQueue&) = delete;
    OpenCLQueue& operator=(const OpenCLQueue&) = delete;

    BackendResult submit(IKernel& kernel, const LaunchConfig& config,
                         std::span<IBuffer* const> args) override {
        m_last_error.clear();

        auto* cl_kernel_obj = dynamic_cast<OpenCLKernel*>(&kernel);
        if (!cl_kernel_obj || !cl_kernel_obj->is_valid()) {
            m_last_error = "Invalid kernel";
            return BackendResult::InvalidArgument;
        }

        if (!config.is_uniform()) {
            m_last_error = "Threadgroup size does not tile the grid";
            return BackendResult::InvalidArgument;
        }

        // Kernel arguments persist between submissions; every one is rebound
        if (args.size() != cl_kernel_obj->num_args()) {
            m_last_error = argument_count_error(cl_kernel_obj->num_args(), args.size());
            return BackendResult::InvalidArgument;
        }

        std::vector<OpenCLBuffer*> buffers(args.size());
        for (SizeT i = 0; i < args.size(); ++i) {
            buffers[i] = dynamic_cast<OpenCLBuffer*>(args[i]);
            if (!buffers[i]) {
                m_last_error = "Buffer for argument " + std::to_string(i) +
                               " does not belong to the OpenCL backend";
                return BackendResult::InvalidArgument;
            }
        }

        std::lock_guard<std::mutex> lock(*m_submit_mutex);

        cl_kernel kernel_handle = cl_kernel_obj->kernel();
        cl_int err = CL_SUCCESS;

        // Argument index == position in the list
        for (SizeT i = 0; i < buffers.size(); ++i) {
            cl_mem mem = buffers[i]->mem();
            err = clSetKernelArg(kernel_handle, static_cast<cl_uint>(i),
                                 sizeof(cl_mem), &mem);
            if (err != CL_SUCCESS) {
                m_last_error = format_opencl_error(err, "clSetKernelArg");
                return BackendResult::InvalidArgument;
            }
        }

        // Host views become kernel inputs
        for (auto* buffer : buffers) {
            err = clEnqueueWriteBuffer(m_queue, buffer->mem(), CL_FALSE,
                                       0, buffer->size(), buffer->contents(),
                                       0, nullptr, nullptr);
            if (err != CL_SUCCESS) {
                m_last_error = format_opencl_error(err, "clEnqueueWriteBuffer");
                clFinish(m_queue);
                return BackendResult::InternalError;
            }
        }

        size_t global_work_size[3] = {
            config.grid_x,
            config.grid_y,
            config.grid_z
        };

        size_t local_work_size[3] = {
            config.block_x,
            config.block_y,
            config.block_z
        };

        cl_uint work_dim = 1;
        if (config.grid_y > 1) work_dim = 2;
        if (config.grid_z > 1) work_dim = 3;

        err = clEnqueueNDRangeKernel(m_queue, kernel_handle,
                                     work_dim, nullptr,
                                     global_work_size,
                                     local_work_size,
                                     0, nullptr, nullptr);
        if (err != CL_SUCCESS) {
            m_last_error = format_opencl_error(err, "clEnqueueNDRangeKernel");
            clFinish(m_queue);
            return BackendResult::LaunchFailed;
        }

        // Kernel results flow back into the host views
        for (auto* buffer : buffers) {
            err = clEnqueueReadBuffer(m_queue, buffer->mem(), CL_FALSE,
                                      0, buffer->size(), buffer->contents(),
                                      0, nullptr, nullptr);
            if (err != CL_SUCCESS) {
                m_last_error = format_opencl_error(err, "clEnqueueReadBuffer");
                clFinish(m_queue);
                return BackendResult::InternalError;
            }
        }

        err = clFinish(m_queue);
        if (err != CL_SUCCESS) {
            m_last_error = format_opencl_error(err, "clFinish");
            return BackendResult::SyncFailed;
        }

        return BackendResult::Success;
    }

    const std::string& last_error() const override {
        return m_last_error;
    }

private:
    cl_command_queue m_queue{nullptr};
    std::shared_ptr<std::mutex> m_submit_mutex;
    std::string m_last_error;
};

// ============================================================================
// OpenCL Backend Implementation
// ============================================================================

class OpenCLBackend : public IComputeBackend {
public:
    OpenCLBackend() = default;

    ~OpenCLBackend() override {
        shutdown();
    }

    // ========================================================================
    // Lifecycle
    // ========================================================================

    BackendResult initialize(const BackendOptions& options) override {
        if (m_initialized) {
            return BackendResult::Success;
        }

        // Get platforms
        cl_uint num_platforms = 0;
        cl_int err = clGetPlatformIDs(0, nullptr, &num_platforms);
        if (err != CL_SUCCESS || num_platforms == 0) {
            m_last_error = "No OpenCL platforms found";
            return BackendResult::DeviceNotFound;
        }

        std::vector<cl_platform_id> platforms(num_platforms);
        err = clGetPlatformIDs(num_platforms, platforms.data(), nullptr);
        if (err != CL_SUCCESS) {
            set_opencl_error(err, "clGetPlatformIDs");
            return BackendResult::DeviceNotFound;
        }

        // GPUs and accelerators first, CPU devices only as a fallback
        m_devices.clear();
        m_platform_for_device.clear();

        collect_devices(platforms, CL_DEVICE_TYPE_GPU | CL_DEVICE_TYPE_ACCELERATOR);
        if (m_devices.empty()) {
            collect_devices(platforms, CL_DEVICE_TYPE_CPU);
        }

        if (m_devices.empty()) {
            m_last_error = "No OpenCL devices found";
            return BackendResult::DeviceNotFound;
        }

        if (options.device_index >= m_devices.size()) {
            m_last_error = "Device index out of range";
            return BackendResult::DeviceNotFound;
        }
        m_current_device = options.device_index;

        cl_device_id device = m_devices[m_current_device];
        cl_platform_id platform = m_platform_for_device[device];

        cl_context_properties props[] = {
            CL_CONTEXT_PLATFORM,
            reinterpret_cast<cl_context_properties>(platform),
            0
        };

        m_context = clCreateContext(props, 1, &device, nullptr, nullptr, &err);
        if (err != CL_SUCCESS) {
            set_opencl_error(err, "clCreateContext");
            return BackendResult::InternalError;
        }

        m_default_queue = create_command_queue(m_context, device,
                                               options.enable_profiling, &err);
        if (err != CL_SUCCESS) {
            set_opencl_error(err, "clCreateCommandQueue");
            clReleaseContext(m_context);
            m_context = nullptr;
            return BackendResult::InternalError;
        }

        m_options = options;

        char device_name[256] = {};
        clGetDeviceInfo(device, CL_DEVICE_NAME, sizeof(device_name),
                        device_name, nullptr);

        char version[128] = {};
        clGetDeviceInfo(device, CL_DEVICE_VERSION, sizeof(version),
                        version, nullptr);

        m_name = std::string("OpenCL (") + device_name + ", " + version + ")";

        m_initialized = true;
        return BackendResult::Success;
    }

    void shutdown() override {
        if (!m_initialized) return;

        if (m_default_queue) {
            clFinish(m_default_queue);
            clReleaseCommandQueue(m_default_queue);
            m_default_queue = nullptr;
        }

        if (m_context) {
            clReleaseContext(m_context);
            m_context = nullptr;
        }

        m_initialized = false;
    }

    bool is_initialized() const override {
        return m_initialized;
    }

    BackendType type() const override {
        return BackendType::OpenCL;
    }

    const std::string& name() const override {
        return m_name;
    }

    // ========================================================================
    // Device Management
    // ========================================================================

    UInt32 device_count() const override {
        return static_cast<UInt32>(m_devices.size());
    }

    DeviceCapabilities get_device_capabilities(UInt32 device_index) const override {
        DeviceCapabilities caps;

        if (device_index >= m_devices.size()) {
            return caps;
        }

        cl_device_id device = m_devices[device_index];

        char name[256] = {};
        clGetDeviceInfo(device, CL_DEVICE_NAME, sizeof(name), name, nullptr);
        caps.name = name;

        char vendor[256] = {};
        clGetDeviceInfo(device, CL_DEVICE_VENDOR, sizeof(vendor), vendor, nullptr);
        caps.vendor = vendor;

        char version[128] = {};
        clGetDeviceInfo(device, CL_DRIVER_VERSION, sizeof(version), version, nullptr);
        caps.driver_version = version;

        cl_device_type dev_type = 0;
        clGetDeviceInfo(device, CL_DEVICE_TYPE, sizeof(dev_type), &dev_type, nullptr);
        if (dev_type & CL_DEVICE_TYPE_GPU) {
            cl_bool host_unified = CL_FALSE;
            clGetDeviceInfo(device, CL_DEVICE_HOST_UNIFIED_MEMORY,
                            sizeof(host_unified), &host_unified, nullptr);
            caps.device_type = host_unified ? DeviceType::IntegratedGPU
                                            : DeviceType::DiscreteGPU;
            caps.supports_unified_memory = (host_unified == CL_TRUE);
        } else if (dev_type & CL_DEVICE_TYPE_CPU) {
            caps.device_type = DeviceType::CPU;
            caps.supports_unified_memory = true;
        } else if (dev_type & CL_DEVICE_TYPE_ACCELERATOR) {
            caps.device_type = DeviceType::Accelerator;
        }

        caps.backend_type = BackendType::OpenCL;
        caps.device_id = device_index;

        cl_ulong global_mem = 0;
        clGetDeviceInfo(device, CL_DEVICE_GLOBAL_MEM_SIZE,
                        sizeof(global_mem), &global_mem, nullptr);
        caps.global_memory = static_cast<SizeT>(global_mem);

        cl_ulong max_alloc = 0;
        clGetDeviceInfo(device, CL_DEVICE_MAX_MEM_ALLOC_SIZE,
                        sizeof(max_alloc), &max_alloc, nullptr);
        caps.max_allocation = static_cast<SizeT>(max_alloc);

        cl_uint compute_units = 0;
        clGetDeviceInfo(device, CL_DEVICE_MAX_COMPUTE_UNITS,
                        sizeof(compute_units), &compute_units, nullptr);
        caps.compute_units = compute_units;

        // Vendor default; the per-kernel preferred multiple is authoritative
        std::string vendor_str(vendor);
        if (vendor_str.find("AMD") != std::string::npos ||
            vendor_str.find("Advanced Micro") != std::string::npos) {
            caps.warp_size = 64;
        } else {
            caps.warp_size = 32;
        }

        size_t max_wg_size = 0;
        clGetDeviceInfo(device, CL_DEVICE_MAX_WORK_GROUP_SIZE,
                        sizeof(max_wg_size), &max_wg_size, nullptr);
        caps.max_workgroup_size = static_cast<SizeT>(max_wg_size);

        size_t max_wg_dims[3] = {0, 0, 0};
        clGetDeviceInfo(device, CL_DEVICE_MAX_WORK_ITEM_SIZES,
                        sizeof(max_wg_dims), max_wg_dims, nullptr);
        caps.max_workgroup_dims[0] = static_cast<UInt32>(max_wg_dims[0]);
        caps.max_workgroup_dims[1] = static_cast<UInt32>(max_wg_dims[1]);
        caps.max_workgroup_dims[2] = static_cast<UInt32>(max_wg_dims[2]);

        cl_device_fp_config fp_config = 0;
        clGetDeviceInfo(device, CL_DEVICE_DOUBLE_FP_CONFIG,
                        sizeof(fp_config), &fp_config, nullptr);
        caps.supports_double = (fp_config != 0);

        return caps;
    }

    UInt32 current_device() const override {
        return m_current_device;
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

        std::unique_ptr<UInt8[]> shadow(new (std::nothrow) UInt8[size]());
        if (!shadow) {
            m_last_error = "Failed to allocate host view";
            return nullptr;
        }

        cl_int err = CL_SUCCESS;
        cl_mem mem = clCreateBuffer(m_context,
                                    CL_MEM_READ_WRITE | CL_MEM_COPY_HOST_PTR,
                                    size, shadow.get(), &err);
        if (err != CL_SUCCESS) {
            set_opencl_error(err, "clCreateBuffer");
            return nullptr;
        }

        return std::make_unique<OpenCLBuffer>(mem, std::move(shadow), size);
    }

    // ========================================================================
    // Kernel Management
    // ========================================================================

    std::unique_ptr<IKernel> create_kernel(
        const std::string& name,
        const std::string& source,
        const std::string& options) override
    {
        if (!m_initialized) {
            m_last_error = "Backend not initialized";
            return nullptr;
        }

        const char* src_ptr = source.c_str();
        size_t src_len = source.length();

        cl_int err = CL_SUCCESS;
        cl_program program = clCreateProgramWithSource(m_context, 1,
                                                       &src_ptr, &src_len,
                                                       &err);
        if (err != CL_SUCCESS) {
            set_opencl_error(err, "clCreateProgramWithSource");
            return nullptr;
        }

        cl_device_id device = m_devices[m_current_device];

        std::string build_opts = "-cl-std=CL1.2";
        if (!options.empty()) {
            build_opts += " " + options;
        }

        err = clBuildProgram(program, 1, &device, build_opts.c_str(),
                             nullptr, nullptr);
        if (err != CL_SUCCESS) {
            m_last_error = "Failed to create library: " + build_log(program, device);
            clReleaseProgram(program);
            return nullptr;
        }

        cl_kernel kernel = clCreateKernel(program, name.c_str(), &err);
        if (err != CL_SUCCESS) {
            if (err == CL_INVALID_KERNEL_NAME) {
                m_last_error = "Failed to find function '" + name + "'";
            } else {
                set_opencl_error(err, "clCreateKernel");
            }
            clReleaseProgram(program);
            return nullptr;
        }

        return std::make_unique<OpenCLKernel>(name, kernel, program, device);
    }

    std::unique_ptr<IQueue> create_queue() override {
        if (!m_initialized) {
            m_last_error = "Backend not initialized";
            return nullptr;
        }

        cl_int err = CL_SUCCESS;
        cl_command_queue queue = create_command_queue(m_context,
                                                      m_devices[m_current_device],
                                                      m_options.enable_profiling,
                                                      &err);
        if (err != CL_SUCCESS) {
            set_opencl_error(err, "clCreateCommandQueue");
            return nullptr;
        }

        return std::make_unique<OpenCLQueue>(queue, m_submit_mutex);
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
    void set_opencl_error(cl_int err, const char* context) {
        m_last_error = format_opencl_error(err, context);
    }

    void collect_devices(const std::vector<cl_platform_id>& platforms,
                         cl_device_type type) {
        for (cl_platform_id platform : platforms) {
            cl_uint num_devices = 0;
            cl_int err = clGetDeviceIDs(platform, type, 0, nullptr, &num_devices);
            if (err != CL_SUCCESS || num_devices == 0) {
                continue;
            }

            std::vector<cl_device_id> devices(num_devices);
            err = clGetDeviceIDs(platform, type, num_devices, devices.data(), nullptr);
            if (err != CL_SUCCESS) {
                continue;
            }

            for (cl_device_id device : devices) {
                m_devices.push_back(device);
                m_platform_for_device[device] = platform;
            }
        }
    }

    static std::string build_log(cl_program program, cl_device_id device) {
        size_t log_size = 0;
        cl_int err = clGetProgramBuildInfo(program, device, CL_PROGRAM_BUILD_LOG,
                                           0, nullptr, &log_size);
        if (err != CL_SUCCESS || log_size == 0) {
            return opencl_error_string(CL_BUILD_PROGRAM_FAILURE);
        }

        std::string log(log_size, '\0');
        err = clGetProgramBuildInfo(program, device, CL_PROGRAM_BUILD_LOG,
                                    log_size, log.data(), nullptr);
        if (err != CL_SUCCESS) {
            return opencl_error_string(CL_BUILD_PROGRAM_FAILURE);
        }

        // Trailing NUL and newlines add nothing to a one-line message
        while (!log.empty() && (log.back() == '\0' || log.back() == '\n')) {
            log.pop_back();
        }
        return log.empty() ? opencl_error_string(CL_BUILD_PROGRAM_FAILURE) : log;
    }

    // State
    bool m_initialized{false};
    std::string m_name;
    BackendOptions m_options;

    // OpenCL handles
    cl_context m_context{nullptr};
    cl_command_queue m_default_queue{nullptr};
    std::vector<cl_device_id> m_devices;
    std::unordered_map<cl_device_id, cl_platform_id> m_platform_for_device;
    UInt32 m_current_device{0};

    // Shared by every queue so submissions never interleave on the device
    std::shared_ptr<std::mutex> m_submit_mutex{std::make_shared<std::mutex>()};

    // Error state
    std::string m_last_error;
};

// ============================================================================
// Backend Creator Functions
// ============================================================================

namespace detail {

std::unique_ptr<IComputeBackend> create_opencl_backend() {
    return std::make_unique<OpenCLBackend>();
}

bool is_opencl_available() {
    cl_uint num_platforms = 0;
    cl_int err = clGetPlatformIDs(0, nullptr, &num_platforms);
    if (err != CL_SUCCESS || num_platforms == 0) {
        return false;
    }

    std::vector<cl_platform_id> platforms(num_platforms);
    if (clGetPlatformIDs(num_platforms, platforms.data(), nullptr) != CL_SUCCESS) {
        return false;
    }

    for (cl_platform_id platform : platforms) {
        cl_uint num_devices = 0;
        err = clGetDeviceIDs(platform, CL_DEVICE_TYPE_ALL, 0,
                             nullptr, &num_devices);
        if (err == CL_SUCCESS && num_devices > 0) {
            return true;
        }
    }

    return false;
}

} // namespace detail

} // namespace cbridge::gpu

#endif // CBRIDGE_HAS_OPENCL
