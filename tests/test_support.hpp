//! # Test Support
//!
//! Temporary directories, log capture and the fake tools the pipeline
//! tests drive instead of a real SIMD compiler and clang.
//!
//! ## Fake compiler
//!
//! A `/bin/sh` script that understands `--version`, `-o`, `-h`, `-MMM` and
//! `--target=`. It reads directives from the source:
//!
//! | Line                | Effect                                        |
//! |---------------------|-----------------------------------------------|
//! | `//h <text>`        | `<text>` is written to the header             |
//! | `//c <text>`        | `<text>` is compiled into the object with `cc` |
//! | `#include "f"`      | `f` is listed as a dependency                 |
//! | `#warning ...`      | echoed to stderr, exit 0                      |
//! | `#error ...`        | echoed to stderr, exit 1, nothing written     |
//!
//! Every invocation appends the source path to a log file.

#ifndef SIMDBUILD_TESTS_TEST_SUPPORT_HPP
#define SIMDBUILD_TESTS_TEST_SUPPORT_HPP

#include "simdbuild/build/build_env.hpp"
#include "simdbuild/log/log.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace simdbuild::test {

/// A fresh directory removed on destruction.
class TempDir {
public:
    TempDir();
    ~TempDir();

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const fs::path& path() const {
        return path_;
    }

private:
    fs::path path_;
};

/// Routes the global logger into memory at Trace level for one test.
class LogCapture {
public:
    LogCapture();
    ~LogCapture();

    [[nodiscard]] const log::MemorySink& sink() const {
        return *sink_;
    }

private:
    std::unique_ptr<log::MemorySink> sink_;
};

void write_file(const fs::path& path, const std::string& content);
[[nodiscard]] std::string read_file(const fs::path& path);

/// Writes an executable script.
void write_script(const fs::path& path, const std::string& content);

/// Lines in `path`, 0 if it does not exist.
[[nodiscard]] size_t count_lines(const fs::path& path);

/// Moves the modification time of `path` by `delta`.
void shift_mtime(const fs::path& path, std::chrono::seconds delta);

/// Writes `bin_dir/ispc`, logging each compiled source to `log`.
fs::path write_fake_compiler(const fs::path& bin_dir, const fs::path& log,
                             const std::string& version = "1.21.0");

/// Writes `bin_dir/clang`, printing `ast_json` and logging each call to `log`.
fs::path write_fake_extractor(const fs::path& bin_dir, const fs::path& ast_json,
                              const fs::path& log);

/// Environment rooted at `root`: cwd `root`, OUT_DIR `root/out`, PATH
/// `root/bin` followed by the real PATH.
[[nodiscard]] build::BuildEnv make_env(const fs::path& root);

/// Translation unit JSON whose declarations all come from `header`.
///
/// `decls_json` is the comma separated list of top-level nodes; the
/// first one gets a `loc` naming `header`.
[[nodiscard]] std::string translation_unit_json(const fs::path& header,
                                                const std::vector<std::string>& decls_json);

} // namespace simdbuild::test

#endif // SIMDBUILD_TESTS_TEST_SUPPORT_HPP
