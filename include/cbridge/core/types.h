#pragma once
/**
 * @file types.h
 * @brief Core type definitions for ComputeBridge
 *
 * Fundamental numeric aliases and the handle type shared by every registry
 * and by the C boundary.
 */

#include <cstdint>
#include <cstddef>
#include <limits>

namespace cbridge {

// ============================================================================
// Numeric Types
// ============================================================================

using Real = double;

using Float32 = float;
using Float64 = double;

// Integer types
using Int8   = std::int8_t;
using Int16  = std::int16_t;
using Int32  = std::int32_t;
using Int64  = std::int64_t;
using UInt8  = std::uint8_t;
using UInt16 = std::uint16_t;
using UInt32 = std::uint32_t;
using UInt64 = std::uint64_t;
using SizeT  = std::size_t;

// ============================================================================
// Handle Identifiers
// ============================================================================

/**
 * @brief Opaque identifier for a registry entry (function or buffer)
 *
 * Handles are issued starting at 1 and grow monotonically. They fit in a C
 * `int` so they can cross the extern "C" boundary unchanged.
 */
using Handle = Int32;

/**
 * @brief Sentinel returned in place of a handle when an operation fails
 */
constexpr Handle kInvalidHandle = -1;

/**
 * @brief Largest handle a table will ever issue
 */
constexpr Handle kMaxHandle = std::numeric_limits<Handle>::max();

} // namespace cbridge
