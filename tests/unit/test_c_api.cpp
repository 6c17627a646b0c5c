/**
 * @file test_c_api.cpp
 * @brief Tests for the extern "C" handle API
 *
 * Runs in its own executable: the C API drives one process-wide bridge,
 * configured here for the CPU reference backend through CBRIDGE_CONFIG.
 */

#include <gtest/gtest.h>
#include "cbridge/interface/api.h"
#include "cbridge/interface/config.h"
#include "../support/test_kernels.h"
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <string>

namespace {

/**
 * @brief Owns an error string returned through the C API
 */
struct ErrorString {
    char* text{nullptr};

    ~ErrorString() { cbridge_free_error(text); }

    std::string str() const { return text ? text : ""; }
};

} // anonymous namespace

class CApiTest : public ::testing::Test {
protected:
    static void SetUpTestSuite() {
        config_path = std::filesystem::temp_directory_path() / "cbridge_c_api_test.xml";

        cbridge::config::BridgeConfig config = cbridge::test::cpu_config();
        ASSERT_TRUE(config.save(config_path.string()));
        ASSERT_EQ(setenv("CBRIDGE_CONFIG", config_path.c_str(), 1), 0);
    }

    static void TearDownTestSuite() {
        cbridge_shutdown();
        unsetenv("CBRIDGE_CONFIG");
        std::error_code ec;
        std::filesystem::remove(config_path, ec);
    }

    static inline std::filesystem::path config_path;
};

TEST_F(CApiTest, InitSucceedsWithoutError) {
    ErrorString error;
    cbridge_init(&error.text);
    EXPECT_EQ(error.text, nullptr) << error.str();

    cbridge_init(&error.text);
    EXPECT_EQ(error.text, nullptr) << error.str();
}

TEST_F(CApiTest, NewFunctionAndName) {
    ErrorString error;
    int id = cbridge_new_function(cbridge::test::kAddSource, "add", &error.text);
    ASSERT_GE(id, 1) << error.str();
    EXPECT_EQ(error.text, nullptr);

    const char* name = cbridge_function_name(id);
    ASSERT_NE(name, nullptr);
    EXPECT_STREQ(name, "add");

    int second = cbridge_new_function(cbridge::test::kAddSource, "add", nullptr);
    EXPECT_NE(second, id);
}

TEST_F(CApiTest, NewFunctionErrors) {
    {
        ErrorString error;
        EXPECT_EQ(cbridge_new_function("", "add", &error.text), -1);
        EXPECT_EQ(error.str(), "Unable to set up function: Missing kernel source");
    }
    {
        ErrorString error;
        EXPECT_EQ(cbridge_new_function(cbridge::test::kAddSource, nullptr, &error.text), -1);
        EXPECT_EQ(error.str(), "Unable to set up function: Missing function name");
    }
    {
        ErrorString error;
        EXPECT_EQ(cbridge_new_function(cbridge::test::kAddSource, "invalid", &error.text), -1);
        EXPECT_EQ(error.str(), "Unable to set up function: Failed to find function 'invalid'");
    }
}

TEST_F(CApiTest, UnknownFunctionNameIsNull) {
    EXPECT_EQ(cbridge_function_name(10000), nullptr);
    EXPECT_EQ(cbridge_function_name(-1), nullptr);
}

TEST_F(CApiTest, BufferRoundTrip) {
    ErrorString error;
    int id = cbridge_new_buffer(64, &error.text);
    ASSERT_GE(id, 1) << error.str();

    auto* bytes = static_cast<unsigned char*>(cbridge_retrieve_buffer(id, &error.text));
    ASSERT_NE(bytes, nullptr) << error.str();
    for (int i = 0; i < 64; ++i) {
        EXPECT_EQ(bytes[i], 0);
        bytes[i] = static_cast<unsigned char>(i);
    }

    auto* again = static_cast<unsigned char*>(cbridge_retrieve_buffer(id, &error.text));
    EXPECT_EQ(again, bytes);
    EXPECT_EQ(again[63], 63);
    EXPECT_EQ(error.text, nullptr);
}

TEST_F(CApiTest, BufferErrors) {
    {
        ErrorString error;
        EXPECT_EQ(cbridge_new_buffer(0, &error.text), -1);
        EXPECT_EQ(error.str(), "Unable to create buffer: Invalid buffer size");
    }
    {
        ErrorString error;
        EXPECT_EQ(cbridge_retrieve_buffer(10000, &error.text), nullptr);
        EXPECT_EQ(error.str(), "Unable to retrieve buffer: Failed to retrieve buffer using Id 10000");
    }
}

TEST_F(CApiTest, RunErrors) {
    int function = cbridge_new_function(cbridge::test::kIncrementSource, "increment", nullptr);
    int buffer = cbridge_new_buffer(16, nullptr);
    ASSERT_GE(function, 1);
    ASSERT_GE(buffer, 1);
    const int buffers[] = {buffer};

    {
        ErrorString error;
        EXPECT_EQ(cbridge_run_function(function, 0, 1, 1, buffers, 1, &error.text), 0);
        EXPECT_EQ(error.str(), "Unable to run function: Invalid grid dimensions 0x1x1");
    }
    {
        ErrorString error;
        EXPECT_EQ(cbridge_run_function(10000, 4, 1, 1, buffers, 1, &error.text), 0);
        EXPECT_EQ(error.str(), "Unable to run function: Failed to retrieve function");
    }
    {
        ErrorString error;
        const int unknown[] = {buffer, 10000};
        EXPECT_EQ(cbridge_run_function(function, 4, 1, 1, unknown, 2, &error.text), 0);
        EXPECT_EQ(error.str(), "Unable to run function: Failed to retrieve buffer 2/2 using Id 10000");
    }
    {
        ErrorString error;
        const int twice[] = {buffer, buffer};
        EXPECT_EQ(cbridge_run_function(function, 4, 1, 1, twice, 2, &error.text), 0);
        EXPECT_EQ(error.str(), "Unable to run function: Expected 1 buffers, got 2");
    }
    {
        ErrorString error;
        EXPECT_EQ(cbridge_run_function(function, 4, 1, 1, nullptr, 1, &error.text), 0);
        EXPECT_EQ(error.str(), "Unable to run function: Invalid buffer list");
    }
}

TEST_F(CApiTest, RunWithoutHostFunctionReportsDeviceError) {
    // The C API cannot register host functions, so the CPU device refuses
    int function = cbridge_new_function(cbridge::test::kIncrementSource, "increment", nullptr);
    int buffer = cbridge_new_buffer(16, nullptr);
    ASSERT_GE(function, 1);
    const int buffers[] = {buffer};

    ErrorString error;
    EXPECT_EQ(cbridge_run_function(function, 4, 1, 1, buffers, 1, &error.text), 0);
    EXPECT_EQ(error.str(), "Unable to run function: No host function registered for: increment");
}

TEST_F(CApiTest, NullErrorPointerIsAccepted) {
    EXPECT_EQ(cbridge_new_buffer(-5, nullptr), -1);
    EXPECT_EQ(cbridge_retrieve_buffer(10000, nullptr), nullptr);
    EXPECT_EQ(cbridge_release_function(10000, nullptr), 0);
    cbridge_free_error(nullptr);
}

TEST_F(CApiTest, ReleaseInvalidatesHandles) {
    int function = cbridge_new_function(cbridge::test::kAddSource, "add", nullptr);
    int buffer = cbridge_new_buffer(8, nullptr);
    ASSERT_GE(function, 1);
    ASSERT_GE(buffer, 1);

    ErrorString error;
    EXPECT_EQ(cbridge_release_function(function, &error.text), 1);
    EXPECT_EQ(cbridge_release_buffer(buffer, &error.text), 1);
    EXPECT_EQ(error.text, nullptr);

    EXPECT_EQ(cbridge_function_name(function), nullptr);
    EXPECT_EQ(cbridge_retrieve_buffer(buffer, nullptr), nullptr);

    ErrorString again;
    EXPECT_EQ(cbridge_release_buffer(buffer, &again.text), 0);
    EXPECT_EQ(again.str(), "Unable to release buffer: Failed to retrieve buffer using Id " +
                           std::to_string(buffer));
}

TEST_F(CApiTest, ShutdownDropsEverything) {
    int buffer = cbridge_new_buffer(8, nullptr);
    ASSERT_GE(buffer, 1);

    cbridge_shutdown();

    // A fresh bridge is created on next use
    ErrorString error;
    cbridge_init(&error.text);
    EXPECT_EQ(error.text, nullptr) << error.str();
    EXPECT_GE(cbridge_new_buffer(8, nullptr), 1);
}
