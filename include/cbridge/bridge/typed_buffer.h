#pragma once
/**
 * @file typed_buffer.h
 * @brief Typed, multi-dimensional views over bridge buffers
 *
 * @code
 * auto grid = cbridge::new_buffer<float>(bridge, 64, 32);   // 64 x 32
 * grid.value()(3, 5) = 1.0f;                                 // x = 3, y = 5
 * @endcode
 *
 * Elements are laid out with x varying fastest, matching the linear index a
 * kernel computes as (z * height + y) * width + x.
 */

#include "cbridge/bridge/bridge.h"
#include <array>
#include <limits>
#include <span>
#include <type_traits>

namespace cbridge {

template <typename T>
class TypedBuffer {
    static_assert(std::is_trivially_copyable_v<T>,
                  "Buffer elements must be trivially copyable");

public:
    TypedBuffer() = default;

    TypedBuffer(Handle handle, T* data, const std::array<SizeT, 3>& extents, SizeT rank)
        : m_handle(handle)
        , m_data(data, extents[0] * extents[1] * extents[2])
        , m_extents(extents)
        , m_rank(rank) {}

    /**
     * @brief Handle to pass to Bridge::run
     */
    Handle handle() const { return m_handle; }

    std::span<T> span() const { return m_data; }
    T* data() const { return m_data.data(); }

    /**
     * @brief Total number of elements
     */
    SizeT size() const { return m_data.size(); }

    SizeT rank() const { return m_rank; }
    SizeT width() const { return m_extents[0]; }
    SizeT height() const { return m_extents[1]; }
    SizeT depth() const { return m_extents[2]; }

    T& operator[](SizeT index) const { return m_data[index]; }

    T& operator()(SizeT x) const { return m_data[x]; }

    T& operator()(SizeT x, SizeT y) const {
        return m_data[y * m_extents[0] + x];
    }

    T& operator()(SizeT x, SizeT y, SizeT z) const {
        return m_data[(z * m_extents[1] + y) * m_extents[0] + x];
    }

    auto begin() const { return m_data.begin(); }
    auto end() const { return m_data.end(); }

private:
    Handle m_handle{kInvalidHandle};
    std::span<T> m_data;
    std::array<SizeT, 3> m_extents{1, 1, 1};
    SizeT m_rank{0};
};

namespace detail {

template <typename T>
Result<TypedBuffer<T>> new_buffer(Bridge& bridge, std::span<const Int64> dims) {
    if (dims.empty()) {
        return make_error(ErrorKind::Allocation, "Missing dimension(s)");
    }
    if (dims.size() > 3) {
        return make_error(ErrorKind::Allocation, "Too many dimensions");
    }

    constexpr Int64 kMaxElements = std::numeric_limits<Int64>::max() / static_cast<Int64>(sizeof(T));

    std::array<SizeT, 3> extents{1, 1, 1};
    Int64 num_elements = 1;
    for (SizeT i = 0; i < dims.size(); ++i) {
        if (dims[i] < 1 || num_elements > kMaxElements / dims[i]) {
            return make_error(ErrorKind::Allocation, "Invalid number of elements");
        }
        extents[i] = static_cast<SizeT>(dims[i]);
        num_elements *= dims[i];
    }

    Result<Handle> handle = bridge.allocate(num_elements * static_cast<Int64>(sizeof(T)));
    if (!handle) {
        return handle.failure();
    }

    Result<void*> view = bridge.view(handle.value());
    if (!view) {
        return view.failure();
    }

    return TypedBuffer<T>(handle.value(), static_cast<T*>(view.value()), extents, dims.size());
}

} // namespace detail

/**
 * @brief Allocate a buffer of width elements
 */
template <typename T>
Result<TypedBuffer<T>> new_buffer(Bridge& bridge, Int64 width) {
    const Int64 dims[] = {width};
    return detail::new_buffer<T>(bridge, dims);
}

/**
 * @brief Allocate a width x height buffer
 *
 * The first extent is the fastest-varying one (x), so element (x, y) lives
 * at y * width + x. A (rows, columns) caller passes the extents swapped:
 * new_buffer<T>(bridge, columns, rows).
 */
template <typename T>
Result<TypedBuffer<T>> new_buffer(Bridge& bridge, Int64 width, Int64 height) {
    const Int64 dims[] = {width, height};
    return detail::new_buffer<T>(bridge, dims);
}

/**
 * @brief Allocate a width x height x depth buffer
 *
 * Extents run from fastest (width) to slowest (depth) varying.
 */
template <typename T>
Result<TypedBuffer<T>> new_buffer(Bridge& bridge, Int64 width, Int64 height, Int64 depth) {
    const Int64 dims[] = {width, height, depth};
    return detail::new_buffer<T>(bridge, dims);
}

/**
 * @brief Allocate a buffer with dimensions given at run time
 *
 * An empty list fails with "Missing dimension(s)".
 */
template <typename T>
Result<TypedBuffer<T>> new_buffer(Bridge& bridge, std::span<const Int64> dims) {
    return detail::new_buffer<T>(bridge, dims);
}

} // namespace cbridge
