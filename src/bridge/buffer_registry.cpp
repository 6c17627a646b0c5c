/**
 * @file buffer_registry.cpp
 * @brief Device buffer allocation and lookup
 */

#include "cbridge/bridge/buffer_registry.h"
#include <limits>

namespace cbridge {

namespace {

std::string unknown_buffer(Handle handle) {
    return "Failed to retrieve buffer using Id " + std::to_string(handle);
}

} // anonymous namespace

BufferRegistry::BufferRegistry(DeviceContext& context)
    : m_context(context) {}

Result<Handle> BufferRegistry::allocate(Int64 size_bytes) {
    if (size_bytes <= 0 ||
        static_cast<UInt64>(size_bytes) > std::numeric_limits<SizeT>::max()) {
        return make_error(ErrorKind::Allocation, "Invalid buffer size");
    }

    auto buffer = std::make_shared<DeviceBuffer>();
    buffer->size = static_cast<SizeT>(size_bytes);

    std::string backend_error;
    bool ready = m_context.with_backend([&](gpu::IComputeBackend& backend) {
        backend.clear_error();
        buffer->memory = backend.allocate(buffer->size);
        if (!buffer->memory) {
            backend_error = backend.last_error();
        }
    });

    if (!ready) {
        return make_error(ErrorKind::Initialization, "Device not initialized");
    }

    if (!buffer->memory || !buffer->view()) {
        return make_error(ErrorKind::Allocation,
                          backend_error.empty() ? "Failed to allocate buffer" : backend_error);
    }

    Handle handle = m_table.insert(buffer);
    if (handle == kInvalidHandle) {
        return make_error(ErrorKind::Allocation, "Buffer handles exhausted");
    }

    m_allocated_bytes += buffer->size;
    m_context.log_debug("Allocated " + std::to_string(buffer->size) +
                        " bytes as buffer Id " + std::to_string(handle));
    return handle;
}

Result<void*> BufferRegistry::view(Handle handle) const {
    auto buffer = m_table.find(handle);
    if (!buffer) {
        return make_error(ErrorKind::Lookup, unknown_buffer(handle));
    }
    return buffer->view();
}

Result<SizeT> BufferRegistry::size_of(Handle handle) const {
    auto buffer = m_table.find(handle);
    if (!buffer) {
        return make_error(ErrorKind::Lookup, unknown_buffer(handle));
    }
    return buffer->size;
}

std::shared_ptr<DeviceBuffer> BufferRegistry::find(Handle handle) const {
    return m_table.find(handle);
}

SizeT BufferRegistry::resolve(std::span<const Handle> handles,
                              std::vector<std::shared_ptr<DeviceBuffer>>& out) const {
    return m_table.find_all(handles, out);
}

Status BufferRegistry::release(Handle handle) {
    auto buffer = m_table.erase(handle);
    if (!buffer) {
        return make_error(ErrorKind::Lookup, unknown_buffer(handle));
    }

    m_allocated_bytes -= buffer->size;
    m_context.log_debug("Released buffer Id " + std::to_string(handle));
    return success();
}

void BufferRegistry::clear() {
    m_table.clear();
    m_allocated_bytes = 0;
}

} // namespace cbridge
