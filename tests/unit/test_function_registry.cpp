/**
 * @file test_function_registry.cpp
 * @brief Unit tests for kernel compilation and function handles
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "cbridge/bridge/bridge.h"
#include "cbridge/bridge/function_registry.h"
#include "../support/mock_backend.h"
#include "../support/test_kernels.h"

using namespace cbridge;
using ::testing::_;
using ::testing::HasSubstr;
using ::testing::NiceMock;
using ::testing::StartsWith;

class FunctionRegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(test::register_test_kernels(bridge));
    }

    FunctionRegistry& functions() { return bridge.functions(); }

    Bridge bridge{test::cpu_config()};
};

TEST_F(FunctionRegistryTest, CompileReturnsPositiveHandle) {
    auto result = functions().compile(test::kAddSource, "add");
    ASSERT_TRUE(result) << result.error();
    EXPECT_GE(result.value(), 1);
    EXPECT_TRUE(result.error().empty());
    EXPECT_EQ(result.kind(), ErrorKind::None);
    EXPECT_TRUE(functions().contains(result.value()));
}

TEST_F(FunctionRegistryTest, RepeatedCompileYieldsDistinctHandles) {
    auto first = functions().compile(test::kAddSource, "add");
    auto second = functions().compile(test::kAddSource, "add");
    ASSERT_TRUE(first);
    ASSERT_TRUE(second);
    EXPECT_NE(first.value(), second.value());
    EXPECT_EQ(functions().size(), 2u);
}

TEST_F(FunctionRegistryTest, NameLookup) {
    auto handle = functions().compile(test::kIncrementSource, "increment");
    ASSERT_TRUE(handle);

    auto name = functions().name(handle.value());
    ASSERT_TRUE(name);
    EXPECT_EQ(name.value(), "increment");
}

TEST_F(FunctionRegistryTest, MissingSource) {
    auto result = functions().compile("", "add");
    EXPECT_FALSE(result);
    EXPECT_EQ(result.kind(), ErrorKind::Compilation);
    EXPECT_EQ(result.error(), "Missing kernel source");
}

TEST_F(FunctionRegistryTest, MissingSourceIsReportedBeforeMissingName) {
    auto result = functions().compile("", "");
    EXPECT_EQ(result.error(), "Missing kernel source");
}

TEST_F(FunctionRegistryTest, MissingFunctionName) {
    auto result = functions().compile(test::kAddSource, "");
    EXPECT_FALSE(result);
    EXPECT_EQ(result.error(), "Missing function name");
}

TEST_F(FunctionRegistryTest, InvalidSourceFailsToCreateLibrary) {
    auto result = functions().compile("this is not kernel code {", "add");
    EXPECT_FALSE(result);
    EXPECT_EQ(result.kind(), ErrorKind::Compilation);
    EXPECT_THAT(result.error(), StartsWith("Failed to create library"));
}

TEST_F(FunctionRegistryTest, UnknownEntryPoint) {
    auto result = functions().compile(test::kAddSource, "invalid");
    EXPECT_FALSE(result);
    EXPECT_EQ(result.error(), "Failed to find function 'invalid'");
}

TEST_F(FunctionRegistryTest, FailedCompileCreatesNoEntry) {
    ASSERT_TRUE(functions().compile(test::kAddSource, "add"));
    const SizeT before = functions().size();

    EXPECT_FALSE(functions().compile(test::kAddSource, "invalid"));
    EXPECT_FALSE(functions().compile("", "add"));
    EXPECT_EQ(functions().size(), before);
}

TEST_F(FunctionRegistryTest, UnknownHandleLookupFails) {
    auto name = functions().name(10000);
    EXPECT_FALSE(name);
    EXPECT_EQ(name.kind(), ErrorKind::Lookup);
    EXPECT_EQ(name.error(), "Failed to retrieve function using Id 10000");

    EXPECT_EQ(functions().find(0), nullptr);
    EXPECT_EQ(functions().find(kInvalidHandle), nullptr);
}

TEST_F(FunctionRegistryTest, ReleasedHandleBehavesLikeUnknown) {
    auto handle = functions().compile(test::kAddSource, "add");
    ASSERT_TRUE(handle);

    EXPECT_TRUE(functions().release(handle.value()));
    EXPECT_FALSE(functions().contains(handle.value()));
    EXPECT_FALSE(functions().name(handle.value()));

    auto again = functions().release(handle.value());
    EXPECT_FALSE(again);
    EXPECT_EQ(again.kind(), ErrorKind::Lookup);

    auto next = functions().compile(test::kAddSource, "add");
    ASSERT_TRUE(next);
    EXPECT_GT(next.value(), handle.value());
}

TEST(FunctionRegistryContextTest, UninitializedDeviceIsReported) {
    DeviceContext context(std::make_unique<NiceMock<test::MockBackend>>());
    FunctionRegistry functions(context);

    auto result = functions.compile(test::kAddSource, "add");
    EXPECT_FALSE(result);
    EXPECT_EQ(result.kind(), ErrorKind::Initialization);
    EXPECT_EQ(result.error(), "Device not initialized");
}

TEST(FunctionRegistryContextTest, QueueFailureIsReported) {
    auto backend = std::make_unique<NiceMock<test::MockBackend>>();
    EXPECT_CALL(*backend, create_queue()).WillOnce([] {
        return std::unique_ptr<gpu::IQueue>();
    });

    DeviceContext context(std::move(backend));
    ASSERT_TRUE(context.initialize());
    FunctionRegistry functions(context);

    auto result = functions.compile(test::kAddSource, "add");
    EXPECT_FALSE(result);
    EXPECT_EQ(result.kind(), ErrorKind::Compilation);
    EXPECT_EQ(result.error(), "Failed to set up command queue");
    EXPECT_EQ(functions.size(), 0u);
}

TEST(FunctionRegistryContextTest, BackendBuildLogIsPassedThrough) {
    auto backend = std::make_unique<NiceMock<test::MockBackend>>();
    auto* mock = backend.get();
    mock->error = "Failed to create library: <source>:2:5: error: use of undeclared identifier 'x'";
    EXPECT_CALL(*mock, create_kernel("add", _, _))
        .WillOnce([](const std::string&, const std::string&, const std::string&) {
            return std::unique_ptr<gpu::IKernel>();
        });
    EXPECT_CALL(*mock, create_queue()).Times(0);

    DeviceContext context(std::move(backend));
    ASSERT_TRUE(context.initialize());
    FunctionRegistry functions(context);

    auto result = functions.compile(test::kAddSource, "add");
    EXPECT_FALSE(result);
    EXPECT_THAT(result.error(), HasSubstr("undeclared identifier 'x'"));
}

TEST(FunctionRegistryContextTest, CompilerOptionsReachTheBackend) {
    auto backend = std::make_unique<NiceMock<test::MockBackend>>();
    auto* mock = backend.get();
    EXPECT_CALL(*mock, create_kernel("add", _, "-DSCALE=2")).Times(1);
    EXPECT_CALL(*mock, create_queue()).WillOnce([] {
        return std::unique_ptr<gpu::IQueue>(std::make_unique<NiceMock<test::MockQueue>>());
    });

    DeviceContext context(std::move(backend));
    gpu::BackendOptions options;
    options.compiler_options = "-DSCALE=2";
    ASSERT_TRUE(context.initialize(gpu::BackendType::Auto, options));
    FunctionRegistry functions(context);

    EXPECT_TRUE(functions.compile(test::kAddSource, "add"));
}
