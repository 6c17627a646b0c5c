/**
 * @file test_config.cpp
 * @brief Unit tests for XML bridge configuration
 */

#include <gtest/gtest.h>
#include "cbridge/interface/config.h"
#include <filesystem>
#include <fstream>
#include <stdexcept>

using namespace cbridge;
using namespace cbridge::config;

class BridgeConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        path = std::filesystem::temp_directory_path() /
               (std::string("cbridge_") + info->name() + ".xml");
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove(path, ec);
    }

    void write(const std::string& xml) {
        std::ofstream out(path);
        out << xml;
    }

    std::filesystem::path path;
};

TEST_F(BridgeConfigTest, Defaults) {
    BridgeConfig config = BridgeConfig::defaults();
    EXPECT_EQ(config.backend, gpu::BackendType::Auto);
    EXPECT_EQ(config.device_index, 0u);
    EXPECT_TRUE(config.compiler_options.empty());
    EXPECT_FALSE(config.profiling);
    EXPECT_FALSE(config.debug);
}

TEST_F(BridgeConfigTest, LoadAllSections) {
    write(R"(<?xml version="1.0"?>
<bridge_config>
  <device>
    <backend>OpenCL</backend>
    <device_index>1</device_index>
  </device>
  <compiler>
    <options>-cl-fast-relaxed-math</options>
  </compiler>
  <diagnostics>
    <profiling>true</profiling>
    <debug>true</debug>
  </diagnostics>
</bridge_config>)");

    BridgeConfig config = BridgeConfig::load(path.string());
    EXPECT_EQ(config.backend, gpu::BackendType::OpenCL);
    EXPECT_EQ(config.device_index, 1u);
    EXPECT_EQ(config.compiler_options, "-cl-fast-relaxed-math");
    EXPECT_TRUE(config.profiling);
    EXPECT_TRUE(config.debug);
}

TEST_F(BridgeConfigTest, MissingSectionsKeepDefaults) {
    write("<bridge_config><device><backend>cpu</backend></device></bridge_config>");

    BridgeConfig config = BridgeConfig::load(path.string());
    EXPECT_EQ(config.backend, gpu::BackendType::CPU);
    EXPECT_EQ(config.device_index, 0u);
    EXPECT_FALSE(config.debug);
}

TEST_F(BridgeConfigTest, UnreadableFileThrows) {
    EXPECT_THROW(BridgeConfig::load((path.parent_path() / "cbridge_missing.xml").string()),
                 std::runtime_error);
}

TEST_F(BridgeConfigTest, MalformedXmlThrows) {
    write("<bridge_config><device>");
    EXPECT_THROW(BridgeConfig::load(path.string()), std::runtime_error);
}

TEST_F(BridgeConfigTest, UnknownRootThrows) {
    write("<engine_config/>");
    EXPECT_THROW(BridgeConfig::load(path.string()), std::runtime_error);
}

TEST_F(BridgeConfigTest, SaveThenLoad) {
    BridgeConfig original;
    original.backend = gpu::BackendType::CPU;
    original.device_index = 2;
    original.compiler_options = "-DWIDTH=64";
    original.debug = true;

    ASSERT_TRUE(original.save(path.string()));

    BridgeConfig loaded = BridgeConfig::load(path.string());
    EXPECT_EQ(loaded.backend, gpu::BackendType::CPU);
    EXPECT_EQ(loaded.device_index, 2u);
    EXPECT_EQ(loaded.compiler_options, "-DWIDTH=64");
    EXPECT_TRUE(loaded.debug);
    EXPECT_FALSE(loaded.profiling);
}

TEST_F(BridgeConfigTest, BackendOptionsMirrorConfig) {
    BridgeConfig config;
    config.device_index = 3;
    config.compiler_options = "-DFOO";
    config.profiling = true;
    config.debug = true;

    gpu::BackendOptions options = config.to_backend_options();
    EXPECT_EQ(options.device_index, 3u);
    EXPECT_EQ(options.compiler_options, "-DFOO");
    EXPECT_TRUE(options.enable_profiling);
    EXPECT_TRUE(options.enable_debugging);
}
