/**
 * @file bridge.cpp
 * @brief Bridge facade implementation
 */

#include "cbridge/bridge/bridge.h"

namespace cbridge {

// ============================================================================
// Bridge Implementation (PIMPL)
// ============================================================================

class BridgeImpl {
public:
    explicit BridgeImpl(const config::BridgeConfig& cfg)
        : config(cfg)
        , functions(context)
        , buffers(context)
        , dispatcher(context, functions, buffers) {}

    BridgeImpl(std::unique_ptr<gpu::IComputeBackend> backend, const config::BridgeConfig& cfg)
        : config(cfg)
        , context(std::move(backend))
        , functions(context)
        , buffers(context)
        , dispatcher(context, functions, buffers) {}

    ~BridgeImpl() {
        // Native objects go before the device does
        functions.clear();
        buffers.clear();
        context.shutdown();
    }

    Status ensure_initialized() {
        if (context.is_ready()) {
            return success();
        }
        return context.initialize(config.backend, config.to_backend_options());
    }

    config::BridgeConfig config;
    DeviceContext context;
    FunctionRegistry functions;
    BufferRegistry buffers;
    DispatchEngine dispatcher;
};

// ============================================================================
// Bridge Public Interface
// ============================================================================

Bridge::Bridge()
    : m_impl(std::make_unique<BridgeImpl>(config::BridgeConfig::defaults())) {}

Bridge::Bridge(const config::BridgeConfig& config)
    : m_impl(std::make_unique<BridgeImpl>(config)) {}

Bridge::Bridge(std::unique_ptr<gpu::IComputeBackend> backend,
               const config::BridgeConfig& config)
    : m_impl(std::make_unique<BridgeImpl>(std::move(backend), config)) {}

Bridge::~Bridge() = default;

Bridge::Bridge(Bridge&&) noexcept = default;
Bridge& Bridge::operator=(Bridge&&) noexcept = default;

Status Bridge::initialize() {
    Status status = m_impl->ensure_initialized();
    if (!status) {
        return status.with_context("Unable to initialize device: ");
    }
    return status;
}

bool Bridge::is_initialized() const {
    return m_impl->context.is_ready();
}

void Bridge::shutdown() {
    m_impl->functions.clear();
    m_impl->buffers.clear();
    m_impl->context.shutdown();
}

Result<Handle> Bridge::compile(const std::string& source, const std::string& entry_point) {
    static const std::string kContext = "Unable to set up function: ";

    if (Status status = m_impl->ensure_initialized(); !status) {
        return status.with_context(kContext);
    }

    Result<Handle> result = m_impl->functions.compile(source, entry_point);
    if (!result) {
        return result.with_context(kContext);
    }
    return result;
}

Result<std::string> Bridge::function_name(Handle function) const {
    Result<std::string> result = m_impl->functions.name(function);
    if (!result) {
        return result.with_context("Unable to retrieve function: ");
    }
    return result;
}

Status Bridge::release_function(Handle function) {
    Status status = m_impl->functions.release(function);
    if (!status) {
        return status.with_context("Unable to release function: ");
    }
    return status;
}

Result<Handle> Bridge::allocate(Int64 size_bytes) {
    static const std::string kContext = "Unable to create buffer: ";

    if (Status status = m_impl->ensure_initialized(); !status) {
        return status.with_context(kContext);
    }

    Result<Handle> result = m_impl->buffers.allocate(size_bytes);
    if (!result) {
        return result.with_context(kContext);
    }
    return result;
}

Result<void*> Bridge::view(Handle buffer) {
    Result<void*> result = m_impl->buffers.view(buffer);
    if (!result) {
        return result.with_context("Unable to retrieve buffer: ");
    }
    return result;
}

Result<SizeT> Bridge::buffer_size(Handle buffer) const {
    Result<SizeT> result = m_impl->buffers.size_of(buffer);
    if (!result) {
        return result.with_context("Unable to retrieve buffer: ");
    }
    return result;
}

Status Bridge::release_buffer(Handle buffer) {
    Status status = m_impl->buffers.release(buffer);
    if (!status) {
        return status.with_context("Unable to release buffer: ");
    }
    return status;
}

Status Bridge::run(Handle function, const Grid& grid, std::span<const Handle> buffers) {
    static const std::string kContext = "Unable to run function: ";

    if (Status status = m_impl->ensure_initialized(); !status) {
        return status.with_context(kContext);
    }

    Status status = m_impl->dispatcher.run(function, grid, buffers);
    if (!status) {
        return status.with_context(kContext);
    }
    return status;
}

Status Bridge::run(Handle function, const Grid& grid, std::initializer_list<Handle> buffers) {
    return run(function, grid, std::span<const Handle>(buffers.begin(), buffers.size()));
}

Status Bridge::register_host_function(const std::string& name, gpu::HostKernelFunc func) {
    static const std::string kContext = "Unable to register host function: ";

    if (Status status = m_impl->ensure_initialized(); !status) {
        return status.with_context(kContext);
    }

    gpu::BackendResult result = gpu::BackendResult::Success;
    std::string backend_error;
    m_impl->context.with_backend([&](gpu::IComputeBackend& backend) {
        result = backend.register_host_kernel(name, std::move(func));
        if (result != gpu::BackendResult::Success) {
            backend_error = backend.last_error();
        }
    });

    if (result != gpu::BackendResult::Success) {
        if (backend_error.empty()) {
            backend_error = gpu::result_to_string(result);
        }
        return make_error(ErrorKind::Compilation, kContext + backend_error);
    }
    return success();
}

const config::BridgeConfig& Bridge::config() const {
    return m_impl->config;
}

DeviceContext& Bridge::context() {
    return m_impl->context;
}

FunctionRegistry& Bridge::functions() {
    return m_impl->functions;
}

BufferRegistry& Bridge::buffers() {
    return m_impl->buffers;
}

} // namespace cbridge
