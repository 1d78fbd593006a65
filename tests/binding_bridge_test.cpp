#include "simdbuild/bindings/binding_bridge.hpp"
#include "test_support.hpp"

#include <chrono>
#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace simdbuild;
using namespace simdbuild::bindings;
using simdbuild::test::count_lines;
using simdbuild::test::read_file;
using simdbuild::test::TempDir;
using simdbuild::test::write_file;

// ============================================================================
// Fixture
// ============================================================================

class BindingBridgeTest : public ::testing::Test {
protected:
    void SetUp() override {
        env_ = test::make_env(dir_.path());
        out_ = dir_.path() / "out";
        header_ = out_ / "kernel_ispc.h";
        ast_ = dir_.path() / "ast.json";
        extractor_log_ = dir_.path() / "clang.log";

        write_file(header_, "void add(float *out, uint32_t n);\n");
        write_file(ast_, test::translation_unit_json(header_, {ADD_FUNCTION}));
        test::write_fake_extractor(dir_.path() / "bin", ast_, extractor_log_);

        request_.name = "kernels";
        request_.out_dir = out_;
        request_.headers = {header_};
    }

    static constexpr const char* ADD_FUNCTION =
        R"json({"id":"0x20","kind":"FunctionDecl","range":{"begin":{},"end":{}},"name":"add",)json"
        R"json("type":{"qualType":"void (float *, uint32_t)"},"inner":[)json"
        R"json({"id":"0x21","kind":"ParmVarDecl","loc":{},"range":{"begin":{},"end":{}},)json"
        R"json("name":"out","type":{"qualType":"float *"}},)json"
        R"json({"id":"0x22","kind":"ParmVarDecl","loc":{},"range":{"begin":{},"end":{}},)json"
        R"json("name":"n","type":{"qualType":"uint32_t"}}]})json";

    TempDir dir_;
    build::BuildEnv env_;
    fs::path out_;
    fs::path header_;
    fs::path ast_;
    fs::path extractor_log_;
    BindingRequest request_;
};

// ============================================================================
// Generation
// ============================================================================

TEST_F(BindingBridgeTest, GeneratesModuleAndAggregate) {
    BindingBridge bridge(env_);
    auto result = bridge.generate(request_);
    ASSERT_TRUE(is_ok(result)) << unwrap_err(result).to_string();
    const auto& module = unwrap(result);

    EXPECT_TRUE(module.regenerated);
    EXPECT_EQ(module.path, out_ / "kernels.rs");
    EXPECT_EQ(module.declaration_count, 1u);
    EXPECT_NE(module.text.find("pub unsafe fn add(out: *mut f32, n: u32);"), std::string::npos);
    EXPECT_EQ(read_file(module.path), module.text);
    EXPECT_EQ(module.header_hash.size(), 16u);

    auto aggregate = read_file(out_ / aggregate_header_name("kernels"));
    EXPECT_EQ(aggregate, "#include <stdint.h>\n#include <stdbool.h>\n#include \"" +
                             header_.string() + "\"\n");

    auto logged = read_file(extractor_log_);
    EXPECT_NE(logged.find("-ast-dump=json"), std::string::npos);
    EXPECT_NE(logged.find("_kernels_ispc_bindings.h"), std::string::npos);
}

TEST_F(BindingBridgeTest, UnchangedHeadersAreReused) {
    BindingBridge bridge(env_);
    ASSERT_TRUE(is_ok(bridge.generate(request_)));
    auto aggregate_path = out_ / aggregate_header_name("kernels");
    auto aggregate_mtime = fs::last_write_time(aggregate_path);

    auto second = bridge.generate(request_);
    ASSERT_TRUE(is_ok(second));
    EXPECT_FALSE(unwrap(second).regenerated);
    EXPECT_EQ(unwrap(second).declaration_count, 1u);
    EXPECT_EQ(count_lines(extractor_log_), 1u);
    EXPECT_EQ(fs::last_write_time(aggregate_path), aggregate_mtime);
}

TEST_F(BindingBridgeTest, OutlivesTemporaryEnvironment) {
    BindingBridge bridge(test::make_env(dir_.path()));
    auto result = bridge.generate(request_);
    ASSERT_TRUE(is_ok(result)) << unwrap_err(result).to_string();
    EXPECT_TRUE(unwrap(result).regenerated);
    EXPECT_EQ(count_lines(extractor_log_), 1u);
}

TEST_F(BindingBridgeTest, ChangedHeaderRegenerates) {
    BindingBridge bridge(env_);
    auto first = bridge.generate(request_);
    ASSERT_TRUE(is_ok(first));

    write_file(header_, "void add(float *out, uint32_t n);\nvoid sub(void);\n");
    auto second = bridge.generate(request_);
    ASSERT_TRUE(is_ok(second));
    EXPECT_TRUE(unwrap(second).regenerated);
    EXPECT_NE(unwrap(second).header_hash, unwrap(first).header_hash);
    EXPECT_EQ(count_lines(extractor_log_), 2u);
}

TEST_F(BindingBridgeTest, DeletedModuleRegenerates) {
    BindingBridge bridge(env_);
    ASSERT_TRUE(is_ok(bridge.generate(request_)));
    fs::remove(out_ / "kernels.rs");

    auto again = bridge.generate(request_);
    ASSERT_TRUE(is_ok(again));
    EXPECT_TRUE(unwrap(again).regenerated);
    EXPECT_TRUE(fs::exists(out_ / "kernels.rs"));
}

TEST_F(BindingBridgeTest, MissingSymbolIsWarned) {
    test::LogCapture capture;
    request_.library_symbols = {"other"};
    BindingBridge bridge(env_);
    auto result = bridge.generate(request_);
    ASSERT_TRUE(is_ok(result));

    ASSERT_EQ(unwrap(result).warnings.size(), 1u);
    EXPECT_NE(unwrap(result).warnings[0].find("'add'"), std::string::npos);
    EXPECT_GE(capture.sink().count(log::LogLevel::Warn, "bindings"), 1u);
}

TEST_F(BindingBridgeTest, WarningsSurviveReuse) {
    static constexpr const char* SYNC_FUNCTION =
        R"json({"id":"0x30","kind":"FunctionDecl","range":{"begin":{},"end":{}},)json"
        R"json("name":"ISPCSync","type":{"qualType":"void (void *)"}})json";
    write_file(ast_, test::translation_unit_json(header_, {ADD_FUNCTION, SYNC_FUNCTION}));
    request_.library_symbols = {"other"};

    BindingBridge bridge(env_);
    auto first = bridge.generate(request_);
    ASSERT_TRUE(is_ok(first)) << unwrap_err(first).to_string();
    ASSERT_TRUE(unwrap(first).regenerated);
    ASSERT_EQ(unwrap(first).warnings.size(), 2u);

    test::LogCapture capture;
    auto second = bridge.generate(request_);
    ASSERT_TRUE(is_ok(second));
    EXPECT_FALSE(unwrap(second).regenerated);
    EXPECT_EQ(unwrap(second).warnings, unwrap(first).warnings);
    EXPECT_EQ(capture.sink().count(log::LogLevel::Warn, "bindings"), 2u);
    EXPECT_EQ(count_lines(extractor_log_), 1u);

    request_.library_symbols = {"add"};
    auto third = bridge.generate(request_);
    ASSERT_TRUE(is_ok(third));
    EXPECT_FALSE(unwrap(third).regenerated);
    ASSERT_EQ(unwrap(third).warnings.size(), 1u);
    EXPECT_NE(unwrap(third).warnings[0].find("ISPCSync"), std::string::npos);
}

TEST_F(BindingBridgeTest, UnderscorePrefixedSymbolCounts) {
    request_.library_symbols = {"_add"};
    BindingBridge bridge(env_);
    auto result = bridge.generate(request_);
    ASSERT_TRUE(is_ok(result));
    EXPECT_TRUE(unwrap(result).warnings.empty());
}

// ============================================================================
// Failures
// ============================================================================

TEST_F(BindingBridgeTest, MissingExtractor) {
    env_.bindgen = "no-such-clang";
    BindingBridge bridge(env_);
    auto result = bridge.generate(request_);
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, build::ErrorKind::ToolNotFound);
    EXPECT_FALSE(fs::exists(out_ / "kernels.rs"));
}

TEST_F(BindingBridgeTest, MalformedOutput) {
    write_file(ast_, "{\"kind\": \"TranslationUnitDecl\", ");
    BindingBridge bridge(env_);
    auto result = bridge.generate(request_);
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, build::ErrorKind::BindingGeneration);
    EXPECT_EQ(unwrap_err(result).message, "Malformed declaration extractor output");
    EXPECT_FALSE(fs::exists(out_ / "kernels.rs.hash"));
}

TEST_F(BindingBridgeTest, ExtractorFailureKeepsStderr) {
    test::write_script(dir_.path() / "bin" / "clang",
                       "#!/bin/sh\necho 'kernel_ispc.h:1:1: error: unknown type' >&2\nexit 1\n");
    BindingBridge bridge(env_);
    auto result = bridge.generate(request_);
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, build::ErrorKind::BindingGeneration);
    EXPECT_EQ(unwrap_err(result).detail, "kernel_ispc.h:1:1: error: unknown type\n");
}

TEST_F(BindingBridgeTest, UnreadableHeader) {
    request_.headers.push_back(out_ / "missing_ispc.h");
    BindingBridge bridge(env_);
    auto result = bridge.generate(request_);
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, build::ErrorKind::BindingGeneration);
}

TEST(ExtractorArgumentsTest, DumpsJsonAst) {
    std::vector<std::string> expected = {"-x",      "c",           "-fsyntax-only",
                                         "-Xclang", "-ast-dump=json", "/o/_k_ispc_bindings.h"};
    EXPECT_EQ(extractor_arguments("/o/_k_ispc_bindings.h"), expected);
    EXPECT_EQ(aggregate_header_name("k"), "_k_ispc_bindings.h");
}
