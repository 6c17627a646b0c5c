/**
 * @file config_loader.cpp
 * @brief XML configuration loading implementation
 *
 * Reads and writes the bridge configuration using pugixml.
 */

#include "cbridge/interface/config.h"
#include <pugixml.hpp>
#include <stdexcept>

namespace cbridge::config {

namespace {

const char* backend_to_string(gpu::BackendType type) {
    switch (type) {
        case gpu::BackendType::CPU:    return "cpu";
        case gpu::BackendType::OpenCL: return "opencl";
        default:                       return "auto";
    }
}

} // anonymous namespace

// ============================================================================
// BridgeConfig Implementation
// ============================================================================

BridgeConfig BridgeConfig::load(const std::string& path) {
    pugi::xml_document doc;
    pugi::xml_parse_result result = doc.load_file(path.c_str());

    if (!result) {
        throw std::runtime_error("Failed to load config: " + std::string(result.description()));
    }

    BridgeConfig config = defaults();

    auto root = doc.child("bridge_config");
    if (!root) {
        root = doc.child("config");
    }
    if (!root) {
        throw std::runtime_error("Invalid bridge config XML: no root element");
    }

    // Device settings
    if (auto device = root.child("device")) {
        std::string backend = device.child("backend").text().as_string("auto");
        config.backend = gpu::BackendFactory::parse_type(backend);
        config.device_index = device.child("device_index").text().as_uint(config.device_index);
    }

    // Compiler settings
    if (auto compiler = root.child("compiler")) {
        config.compiler_options = compiler.child("options").text().as_string(
            config.compiler_options.c_str());
    }

    // Diagnostics settings
    if (auto diagnostics = root.child("diagnostics")) {
        config.profiling = diagnostics.child("profiling").text().as_bool(config.profiling);
        config.debug = diagnostics.child("debug").text().as_bool(config.debug);
    }

    return config;
}

BridgeConfig BridgeConfig::defaults() {
    return BridgeConfig{};
}

bool BridgeConfig::save(const std::string& path) const {
    pugi::xml_document doc;

    auto decl = doc.prepend_child(pugi::node_declaration);
    decl.append_attribute("version") = "1.0";
    decl.append_attribute("encoding") = "UTF-8";

    auto root = doc.append_child("bridge_config");

    // Device settings
    auto device = root.append_child("device");
    device.append_child("backend").text().set(backend_to_string(backend));
    device.append_child("device_index").text().set(static_cast<unsigned int>(device_index));

    // Compiler settings
    auto compiler = root.append_child("compiler");
    compiler.append_child("options").text().set(compiler_options.c_str());

    // Diagnostics settings
    auto diagnostics = root.append_child("diagnostics");
    diagnostics.append_child("profiling").text().set(profiling);
    diagnostics.append_child("debug").text().set(debug);

    return doc.save_file(path.c_str());
}

gpu::BackendOptions BridgeConfig::to_backend_options() const {
    gpu::BackendOptions options;
    options.device_index = device_index;
    options.enable_profiling = profiling;
    options.enable_debugging = debug;
    options.compiler_options = compiler_options;
    return options;
}

} // namespace cbridge::config
