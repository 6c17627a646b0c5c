/**
 * @file api.cpp
 * @brief C API over a process-wide Bridge
 */

#include "cbridge/interface/api.h"
#include "cbridge/bridge/bridge.h"
#include <cstdlib>
#include <cstring>
#include <exception>
#include <memory>
#include <shared_mutex>
#include <span>
#include <string>

using cbridge::Bridge;
using cbridge::Handle;
using cbridge::kInvalidHandle;

namespace {

std::shared_mutex g_bridge_mutex;
std::unique_ptr<Bridge> g_bridge;

void set_error(char** error, const std::string& message) {
    if (!error) return;

    char* copy = static_cast<char*>(std::malloc(message.size() + 1));
    if (!copy) return;

    std::memcpy(copy, message.c_str(), message.size() + 1);
    *error = copy;
}

cbridge::config::BridgeConfig load_config() {
    const char* path = std::getenv("CBRIDGE_CONFIG");
    if (path && *path) {
        return cbridge::config::BridgeConfig::load(path);
    }
    return cbridge::config::BridgeConfig::defaults();
}

/**
 * @brief Run func(bridge) under the shared lock, creating the bridge first
 *
 * Exceptions are reported through error and never leave this function.
 */
template <typename Func>
bool with_bridge(char** error, Func&& func) {
    try {
        {
            std::shared_lock<std::shared_mutex> lock(g_bridge_mutex);
            if (g_bridge) {
                func(*g_bridge);
                return true;
            }
        }

        std::unique_lock<std::shared_mutex> lock(g_bridge_mutex);
        if (!g_bridge) {
            g_bridge = std::make_unique<Bridge>(load_config());
        }
        func(*g_bridge);
        return true;
    } catch (const std::exception& e) {
        set_error(error, std::string("Unable to access device: ") + e.what());
        return false;
    }
}

} // anonymous namespace

extern "C" {

void cbridge_init(char** error) {
    with_bridge(error, [&](Bridge& bridge) {
        cbridge::Status status = bridge.initialize();
        if (!status) {
            set_error(error, status.error());
        }
    });
}

int cbridge_new_function(const char* source, const char* name, char** error) {
    Handle handle = kInvalidHandle;
    with_bridge(error, [&](Bridge& bridge) {
        auto result = bridge.compile(source ? source : "", name ? name : "");
        if (!result) {
            set_error(error, result.error());
            return;
        }
        handle = result.value();
    });
    return handle;
}

const char* cbridge_function_name(int function_id) {
    thread_local std::string t_name;

    bool found = false;
    bool ok = with_bridge(nullptr, [&](Bridge& bridge) {
        auto result = bridge.function_name(function_id);
        if (result) {
            t_name = result.value();
            found = true;
        }
    });

    return ok && found ? t_name.c_str() : nullptr;
}

int cbridge_run_function(int function_id, int width, int height, int depth,
                         const int* buffer_ids, int num_buffer_ids, char** error) {
    if (num_buffer_ids < 0 || (num_buffer_ids > 0 && !buffer_ids)) {
        set_error(error, "Unable to run function: Invalid buffer list");
        return 0;
    }

    bool succeeded = false;
    with_bridge(error, [&](Bridge& bridge) {
        std::span<const Handle> buffers(buffer_ids, static_cast<std::size_t>(num_buffer_ids));
        cbridge::Status status = bridge.run(function_id, {width, height, depth}, buffers);
        if (!status) {
            set_error(error, status.error());
            return;
        }
        succeeded = true;
    });
    return succeeded ? 1 : 0;
}

int cbridge_new_buffer(int size, char** error) {
    Handle handle = kInvalidHandle;
    with_bridge(error, [&](Bridge& bridge) {
        auto result = bridge.allocate(size);
        if (!result) {
            set_error(error, result.error());
            return;
        }
        handle = result.value();
    });
    return handle;
}

void* cbridge_retrieve_buffer(int buffer_id, char** error) {
    void* view = nullptr;
    with_bridge(error, [&](Bridge& bridge) {
        auto result = bridge.view(buffer_id);
        if (!result) {
            set_error(error, result.error());
            return;
        }
        view = result.value();
    });
    return view;
}

int cbridge_release_function(int function_id, char** error) {
    bool succeeded = false;
    with_bridge(error, [&](Bridge& bridge) {
        cbridge::Status status = bridge.release_function(function_id);
        if (!status) {
            set_error(error, status.error());
            return;
        }
        succeeded = true;
    });
    return succeeded ? 1 : 0;
}

int cbridge_release_buffer(int buffer_id, char** error) {
    bool succeeded = false;
    with_bridge(error, [&](Bridge& bridge) {
        cbridge::Status status = bridge.release_buffer(buffer_id);
        if (!status) {
            set_error(error, status.error());
            return;
        }
        succeeded = true;
    });
    return succeeded ? 1 : 0;
}

void cbridge_free_error(char* error) {
    std::free(error);
}

void cbridge_shutdown(void) {
    std::unique_lock<std::shared_mutex> lock(g_bridge_mutex);
    g_bridge.reset();
}

} // extern "C"
