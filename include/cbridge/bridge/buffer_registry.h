#pragma once
/**
 * @file buffer_registry.h
 * @brief Device-visible buffers addressed by integer handle
 *
 * Every buffer exposes a host view whose address never changes while the
 * buffer lives. Bytes written through the view before a dispatch are kernel
 * inputs; bytes the kernel writes are visible through the view once the
 * dispatch has returned.
 */

#include "cbridge/bridge/device_context.h"
#include "cbridge/bridge/handle_table.h"
#include "cbridge/bridge/result.h"
#include <atomic>
#include <memory>
#include <span>
#include <vector>

namespace cbridge {

/**
 * @brief Device memory and its stable host view
 */
struct DeviceBuffer {
    SizeT size{0};
    std::unique_ptr<gpu::IBuffer> memory;

    void* view() const { return memory ? memory->contents() : nullptr; }
};

class BufferRegistry {
public:
    explicit BufferRegistry(DeviceContext& context);

    BufferRegistry(const BufferRegistry&) = delete;
    BufferRegistry& operator=(const BufferRegistry&) = delete;

    /**
     * @brief Allocate size_bytes of zero-initialized device-visible memory
     * @return Handle, or an Allocation failure ("Invalid buffer size" when
     *         size_bytes <= 0)
     */
    Result<Handle> allocate(Int64 size_bytes);

    /**
     * @brief Host view of a buffer
     * @return Pointer, or a Lookup failure
     *         ("Failed to retrieve buffer using Id <h>")
     */
    Result<void*> view(Handle handle) const;

    Result<SizeT> size_of(Handle handle) const;

    std::shared_ptr<DeviceBuffer> find(Handle handle) const;

    /**
     * @brief Resolve handles in order under a single lock
     * @return Position of the first unknown handle, or handles.size()
     */
    SizeT resolve(std::span<const Handle> handles,
                  std::vector<std::shared_ptr<DeviceBuffer>>& out) const;

    /**
     * @brief Drop the buffer; its handle is never issued again
     *
     * Memory is returned once no dispatch references it any more.
     */
    Status release(Handle handle);

    bool contains(Handle handle) const { return m_table.contains(handle); }

    SizeT size() const { return m_table.size(); }

    /**
     * @brief Bytes held by live buffers
     */
    SizeT allocated_bytes() const { return m_allocated_bytes.load(); }

    void clear();

private:
    DeviceContext& m_context;
    HandleTable<DeviceBuffer> m_table;
    std::atomic<SizeT> m_allocated_bytes{0};
};

} // namespace cbridge
