#pragma once
/**
 * @file handle_table.h
 * @brief Thread-safe integer handle to object map
 *
 * Handles are issued from 1 upward in insertion order and are never reused,
 * even after release. Objects are held by shared_ptr so a caller that looked
 * an entry up keeps it alive across a concurrent release.
 */

#include "cbridge/core/types.h"
#include <map>
#include <memory>
#include <mutex>
#include <vector>

namespace cbridge {

template <typename T>
class HandleTable {
public:
    HandleTable() = default;

    HandleTable(const HandleTable&) = delete;
    HandleTable& operator=(const HandleTable&) = delete;

    /**
     * @brief Store an object under the next handle
     * @return New handle, or kInvalidHandle when object is null or the
     *         handle space is exhausted
     */
    Handle insert(std::shared_ptr<T> object) {
        if (!object) {
            return kInvalidHandle;
        }

        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_next == kMaxHandle) {
            return kInvalidHandle;
        }

        Handle handle = ++m_next;
        m_entries.emplace(handle, std::move(object));
        return handle;
    }

    /**
     * @brief Look up an entry
     * @return Object, or nullptr for unknown or released handles
     */
    std::shared_ptr<T> find(Handle handle) const {
        if (handle <= 0) {
            return nullptr;
        }

        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_entries.find(handle);
        return it != m_entries.end() ? it->second : nullptr;
    }

    /**
     * @brief Look up several entries under one lock
     *
     * Stops at the first unknown handle and reports its position.
     * @return Index of the first missing handle, or handles.size() if all
     *         were found
     */
    template <typename Range>
    SizeT find_all(const Range& handles, std::vector<std::shared_ptr<T>>& out) const {
        out.clear();
        out.reserve(handles.size());

        std::lock_guard<std::mutex> lock(m_mutex);
        SizeT index = 0;
        for (Handle handle : handles) {
            auto it = handle > 0 ? m_entries.find(handle) : m_entries.end();
            if (it == m_entries.end()) {
                return index;
            }
            out.push_back(it->second);
            ++index;
        }
        return index;
    }

    /**
     * @brief Remove an entry
     * @return Removed object, or nullptr if the handle was unknown
     */
    std::shared_ptr<T> erase(Handle handle) {
        if (handle <= 0) {
            return nullptr;
        }

        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_entries.find(handle);
        if (it == m_entries.end()) {
            return nullptr;
        }

        auto object = std::move(it->second);
        m_entries.erase(it);
        return object;
    }

    bool contains(Handle handle) const {
        return find(handle) != nullptr;
    }

    SizeT size() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_entries.size();
    }

    /**
     * @brief Handle most recently issued (0 if none)
     */
    Handle last_issued() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_next;
    }

    /**
     * @brief Visit every live entry in handle order
     */
    template <typename Func>
    void for_each(Func&& func) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto& [handle, object] : m_entries) {
            func(handle, *object);
        }
    }

    /**
     * @brief Drop every entry; numbering continues where it left off
     */
    void clear() {
        std::map<Handle, std::shared_ptr<T>> released;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            released.swap(m_entries);
        }
    }

private:
    mutable std::mutex m_mutex;
    std::map<Handle, std::shared_ptr<T>> m_entries;
    Handle m_next{0};
};

} // namespace cbridge
