//! # Pipeline Tests
//!
//! Whole builds through `BuildConfig::compile()` with the fake compiler and
//! extractor from test_support: incremental rebuilds, header invalidation,
//! and the failure paths that must leave the output directory alone.

#include "simdbuild/build/build_config.hpp"
#include "test_support.hpp"

#include <algorithm>
#include <chrono>
#include <fstream>
#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace simdbuild;
using namespace simdbuild::build;
using simdbuild::test::count_lines;
using simdbuild::test::read_file;
using simdbuild::test::TempDir;
using simdbuild::test::write_file;

namespace {

constexpr const char* TRIPLE = "x86_64-unknown-linux-gnu";
constexpr const char* LIBRARY = "libkernelsx86_64-unknown-linux-gnu.a";

/// `int simdbuild_fake_a(void);` as the extractor reports it.
constexpr const char* FAKE_A_FUNCTION =
    R"json({"id":"0x20","kind":"FunctionDecl","range":{"begin":{},"end":{}},)json"
    R"json("name":"simdbuild_fake_a","type":{"qualType":"int (void)"}})json";

std::vector<std::string> read_lines(const fs::path& path) {
    std::vector<std::string> lines;
    std::ifstream in(path);
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }
    return lines;
}

bool watches(const LinkDirectives& directives, const fs::path& path) {
    const auto& watched = directives.rerun_if_changed;
    return std::find(watched.begin(), watched.end(), path) != watched.end();
}

} // namespace

class PipelineTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = dir_.path();
        env_ = test::make_env(root_);
        env_.target = TRIPLE;
        out_ = root_ / "out";
        compiler_log_ = root_ / "ispc.log";
        extractor_log_ = root_ / "clang.log";

        test::write_fake_compiler(root_ / "bin", compiler_log_);
        write_file(root_ / "ast.json",
                   test::translation_unit_json(out_ / "a_ispc.h", {FAKE_A_FUNCTION}));
        test::write_fake_extractor(root_ / "bin", root_ / "ast.json", extractor_log_);

        write_file(root_ / "src" / "common.isph", "// shared helpers\n");
        write_file(root_ / "src" / "a.ispc", "#include \"common.isph\"\n"
                                             "//h int simdbuild_fake_a(void);\n"
                                             "export void a() {}\n");
        write_file(root_ / "src" / "b.ispc", "//h int simdbuild_fake_b(void);\n"
                                             "export void b() {}\n");
    }

    /// Moves the fake compiler to `real/` and puts a wrapper in `bin/` that
    /// runs it, then runs `after` with `$src` and `$dep` set.
    void wrap_compiler(const std::string& after) {
        auto real = test::write_fake_compiler(root_ / "real", compiler_log_);
        std::string script = "#!/bin/sh\n'" + real.string() + "' \"$@\" || exit $?\n";
        script += R"SH([ "$1" = "--version" ] && exit 0
src=""; dep=""
while [ $# -gt 0 ]; do
    case "$1" in
        -MMM) dep="$2"; shift 2 ;;
        *.ispc) src="$1"; shift ;;
        *) shift ;;
    esac
done
)SH";
        script += after;
        test::write_script(root_ / "bin" / "ispc", script);
    }

    BuildConfig two_isa_config(const std::vector<fs::path>& sources) {
        BuildConfig config(env_);
        config.files(sources).target_isas({TargetIsa::Sse2I32x4, TargetIsa::Avx2I32x8});
        return config;
    }

    TempDir dir_;
    fs::path root_;
    BuildEnv env_;
    fs::path out_;
    fs::path compiler_log_;
    fs::path extractor_log_;
};

// ============================================================================
// Successful Builds
// ============================================================================

TEST_F(PipelineTest, FirstBuildProducesLibraryAndBindings) {
    auto config = two_isa_config({"src/a.ispc"});
    auto result = config.compile("kernels");
    ASSERT_TRUE(is_ok(result)) << unwrap_err(result).to_string();
    const auto& output = unwrap(result);

    ASSERT_EQ(output.units.size(), 3u);
    EXPECT_TRUE(output.units[0].is_dispatch());
    EXPECT_EQ(output.units[1].object, out_ / "a_ispc_sse2.o");
    EXPECT_EQ(output.units[2].object, out_ / "a_ispc_avx2.o");
    for (const auto& unit : output.units) {
        EXPECT_TRUE(fs::exists(unit.object)) << unit.object;
    }
    EXPECT_EQ(output.stats.units_total, 3u);
    EXPECT_EQ(output.stats.sources_compiled, 1u);
    EXPECT_EQ(output.stats.sources_reused, 0u);
    EXPECT_EQ(output.compiler_version.to_string(), "1.21.0");

    EXPECT_EQ(output.library.path, out_ / LIBRARY);
    EXPECT_TRUE(fs::exists(output.library.path));
    EXPECT_TRUE(std::binary_search(output.library.defined_symbols.begin(),
                                   output.library.defined_symbols.end(), "simdbuild_fake_a_avx2"));

    EXPECT_EQ(output.bindings.path, out_ / "kernels.rs");
    EXPECT_NE(output.bindings.text.find("pub unsafe fn simdbuild_fake_a() -> i32;"),
              std::string::npos);
    EXPECT_TRUE(output.bindings.warnings.empty());

    ASSERT_EQ(output.directives.link_libs.size(), 1u);
    EXPECT_EQ(output.directives.link_libs[0], "static=kernelsx86_64-unknown-linux-gnu");
    EXPECT_TRUE(watches(output.directives, root_ / "src" / "a.ispc"));
    EXPECT_TRUE(watches(output.directives, root_ / "src" / "common.isph"));
    EXPECT_EQ(count_lines(compiler_log_), 1u);
}

TEST_F(PipelineTest, SecondBuildCompilesNothing) {
    auto first_config = two_isa_config({"src/a.ispc"});
    auto first = first_config.compile("kernels");
    ASSERT_TRUE(is_ok(first)) << unwrap_err(first).to_string();
    auto library_bytes = read_file(out_ / LIBRARY);

    auto second_config = two_isa_config({"src/a.ispc"});
    auto second = second_config.compile("kernels");
    ASSERT_TRUE(is_ok(second)) << unwrap_err(second).to_string();

    EXPECT_EQ(count_lines(compiler_log_), 1u);
    EXPECT_EQ(count_lines(extractor_log_), 1u);
    EXPECT_EQ(unwrap(second).stats.sources_compiled, 0u);
    EXPECT_EQ(unwrap(second).stats.sources_reused, 1u);
    EXPECT_FALSE(unwrap(second).bindings.regenerated);
    EXPECT_EQ(read_file(out_ / LIBRARY), library_bytes);
}

TEST_F(PipelineTest, RebuiltArchiveIsByteIdentical) {
    auto first_config = two_isa_config({"src/a.ispc", "src/b.ispc"});
    ASSERT_TRUE(is_ok(first_config.compile("kernels")));
    auto library_bytes = read_file(out_ / LIBRARY);

    fs::remove(out_ / LIBRARY);
    auto second_config = two_isa_config({"src/a.ispc", "src/b.ispc"});
    ASSERT_TRUE(is_ok(second_config.compile("kernels")));
    EXPECT_EQ(read_file(out_ / LIBRARY), library_bytes);
    EXPECT_EQ(count_lines(compiler_log_), 2u);
}

TEST_F(PipelineTest, ChangedIncludeRecompilesOnlyIncluders) {
    auto first_config = two_isa_config({"src/a.ispc", "src/b.ispc"});
    ASSERT_TRUE(is_ok(first_config.compile("kernels")));
    ASSERT_EQ(count_lines(compiler_log_), 2u);

    test::shift_mtime(root_ / "src" / "common.isph", std::chrono::seconds(5));
    auto second_config = two_isa_config({"src/a.ispc", "src/b.ispc"});
    auto second = second_config.compile("kernels");
    ASSERT_TRUE(is_ok(second)) << unwrap_err(second).to_string();

    auto lines = read_lines(compiler_log_);
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[2], (root_ / "src" / "a.ispc").string());
    EXPECT_EQ(unwrap(second).stats.sources_compiled, 1u);
    EXPECT_EQ(unwrap(second).stats.sources_reused, 1u);
}

TEST_F(PipelineTest, ChangedArgumentsRecompileEverything) {
    auto first_config = two_isa_config({"src/a.ispc", "src/b.ispc"});
    ASSERT_TRUE(is_ok(first_config.compile("kernels")));

    auto second_config = two_isa_config({"src/a.ispc", "src/b.ispc"});
    second_config.opt_level(3);
    ASSERT_TRUE(is_ok(second_config.compile("kernels")));
    EXPECT_EQ(count_lines(compiler_log_), 4u);
}

TEST_F(PipelineTest, SourceEditedDuringCompileIsRebuilt) {
    test::LogCapture capture;
    wrap_compiler("echo '// edited' >> \"$src\"\n"
                  "touch -d \"@$(( $(date +%s) + 5 ))\" \"$src\"\n");

    auto first_config = two_isa_config({"src/a.ispc"});
    auto first = first_config.compile("kernels");
    ASSERT_TRUE(is_ok(first)) << unwrap_err(first).to_string();
    EXPECT_EQ(unwrap(first).stats.sources_compiled, 1u);
    EXPECT_TRUE(capture.sink().contains("changed while compiling"));

    auto second_config = two_isa_config({"src/a.ispc"});
    auto second = second_config.compile("kernels");
    ASSERT_TRUE(is_ok(second)) << unwrap_err(second).to_string();
    EXPECT_EQ(unwrap(second).stats.sources_compiled, 1u);
    EXPECT_EQ(count_lines(compiler_log_), 2u);
}

TEST_F(PipelineTest, RelativeDependencyPathsAreTracked) {
    wrap_compiler("sed -i 's|^" + root_.string() + "/||' \"$dep\"\n");

    auto first_config = two_isa_config({"src/a.ispc", "src/b.ispc"});
    ASSERT_TRUE(is_ok(first_config.compile("kernels")));
    EXPECT_EQ(read_lines(out_ / "a_ispc.idep").front(), "src/a.ispc");

    auto second_config = two_isa_config({"src/a.ispc", "src/b.ispc"});
    auto second = second_config.compile("kernels");
    ASSERT_TRUE(is_ok(second)) << unwrap_err(second).to_string();
    EXPECT_EQ(unwrap(second).stats.sources_compiled, 0u);
    EXPECT_TRUE(watches(unwrap(second).directives, root_ / "src" / "common.isph"));

    test::shift_mtime(root_ / "src" / "common.isph", std::chrono::seconds(5));
    auto third_config = two_isa_config({"src/a.ispc", "src/b.ispc"});
    auto third = third_config.compile("kernels");
    ASSERT_TRUE(is_ok(third)) << unwrap_err(third).to_string();
    EXPECT_EQ(unwrap(third).stats.sources_compiled, 1u);
}

TEST_F(PipelineTest, CompilerWarningsAreLogged) {
    test::LogCapture capture;
    write_file(root_ / "src" / "b.ispc", "#warning gather is slow\nexport void b() {}\n");

    auto config = two_isa_config({"src/b.ispc"});
    auto result = config.compile("kernels");
    ASSERT_TRUE(is_ok(result)) << unwrap_err(result).to_string();
    EXPECT_TRUE(capture.sink().contains("#warning gather is slow"));
    EXPECT_GE(capture.sink().count(log::LogLevel::Warn, "invoke"), 1u);
}

TEST_F(PipelineTest, SingleIsaHasNoDispatchStub) {
    BuildConfig config(env_);
    config.file("src/b.ispc").target_isa(TargetIsa::Avx2I32x8);
    auto result = config.compile("kernels");
    ASSERT_TRUE(is_ok(result)) << unwrap_err(result).to_string();
    ASSERT_EQ(unwrap(result).units.size(), 1u);
    EXPECT_EQ(unwrap(result).units[0].object, out_ / "b_ispc.o");
    EXPECT_FALSE(fs::exists(out_ / "b_ispc_avx2.o"));
}

// ============================================================================
// Failures
// ============================================================================

TEST_F(PipelineTest, MissingCompilerWritesNothing) {
    env_.compiler = "no-such-ispc";
    auto config = two_isa_config({"src/a.ispc"});
    auto result = config.compile("kernels");
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, ErrorKind::ToolNotFound);
    EXPECT_FALSE(fs::exists(out_));
}

TEST_F(PipelineTest, NoSourcesWritesNothing) {
    BuildConfig config(env_);
    auto result = config.compile("kernels");
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, ErrorKind::Configuration);
    EXPECT_FALSE(fs::exists(out_));
    EXPECT_EQ(count_lines(compiler_log_), 0u);
}

TEST_F(PipelineTest, CompilerErrorKeepsStderrVerbatim) {
    auto bad = root_ / "src" / "bad.ispc";
    write_file(bad, "#error unsupported varying index\n");

    auto config = two_isa_config({"src/bad.ispc"});
    auto result = config.compile("kernels");
    ASSERT_TRUE(is_err(result));
    const auto& error = unwrap_err(result);
    EXPECT_EQ(error.kind, ErrorKind::CompilationFailure);
    EXPECT_NE(error.message.find(bad.string()), std::string::npos);
    EXPECT_NE(error.message.find("sse2-i32x4,avx2-i32x8"), std::string::npos);
    EXPECT_EQ(error.detail, bad.string() + ":1:#error unsupported varying index\n");
    EXPECT_FALSE(fs::exists(out_ / LIBRARY));
}

TEST_F(PipelineTest, FirstFailureStopsSequentialBuild) {
    write_file(root_ / "src" / "bad.ispc", "#error broken\n");
    auto config = two_isa_config({"src/bad.ispc", "src/a.ispc", "src/b.ispc"});
    auto result = config.compile("kernels");
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, ErrorKind::CompilationFailure);
    EXPECT_EQ(count_lines(compiler_log_), 1u);
}

TEST_F(PipelineTest, ParallelFailureReportsOneError) {
    write_file(root_ / "src" / "bad.ispc", "#error broken\n");
    write_file(root_ / "src" / "c.ispc", "export void c() {}\n");
    write_file(root_ / "src" / "d.ispc", "export void d() {}\n");
    auto config = two_isa_config({"src/bad.ispc", "src/a.ispc", "src/b.ispc", "src/c.ispc",
                                  "src/d.ispc"});
    config.jobs(2);
    auto result = config.compile("kernels");
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, ErrorKind::CompilationFailure);
    EXPECT_NE(unwrap_err(result).message.find("bad.ispc"), std::string::npos);
    EXPECT_LE(count_lines(compiler_log_), 5u);
    EXPECT_FALSE(fs::exists(out_ / LIBRARY));
}

TEST_F(PipelineTest, ParallelBuildMatchesSequential) {
    auto sequential_config = two_isa_config({"src/a.ispc", "src/b.ispc"});
    ASSERT_TRUE(is_ok(sequential_config.compile("kernels")));
    auto sequential_bytes = read_file(out_ / LIBRARY);

    fs::remove_all(out_);
    auto parallel_config = two_isa_config({"src/a.ispc", "src/b.ispc"});
    parallel_config.jobs(0);
    auto parallel = parallel_config.compile("kernels");
    ASSERT_TRUE(is_ok(parallel)) << unwrap_err(parallel).to_string();
    EXPECT_EQ(unwrap(parallel).stats.sources_compiled, 2u);
    EXPECT_EQ(read_file(out_ / LIBRARY), sequential_bytes);
}

TEST_F(PipelineTest, InstrumentNeedsNewerCompiler) {
    test::write_fake_compiler(root_ / "bin", compiler_log_, "1.9.0");
    auto config = two_isa_config({"src/a.ispc"});
    config.instrument();
    auto result = config.compile("kernels");
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, ErrorKind::Configuration);
    EXPECT_NE(unwrap_err(result).message.find("1.9.1"), std::string::npos);
    EXPECT_FALSE(fs::exists(out_));
}

TEST_F(PipelineTest, UnparseableVersion) {
    test::write_script(root_ / "bin" / "ispc", "#!/bin/sh\necho 'some other tool 3.0'\n");
    auto config = two_isa_config({"src/a.ispc"});
    auto result = config.compile("kernels");
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, ErrorKind::Configuration);
    EXPECT_FALSE(fs::exists(out_));
}

TEST_F(PipelineTest, MissingExtractorFailsAfterArchive) {
    env_.bindgen = "no-such-clang";
    auto config = two_isa_config({"src/a.ispc"});
    auto result = config.compile("kernels");
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, ErrorKind::ToolNotFound);
    EXPECT_TRUE(fs::exists(out_ / LIBRARY));
}
