//! # Binding Generator Bridge
//!
//! Produces the Rust bindings module for a built library.
//!
//! ## Pipeline
//!
//! 1. Write `_<name>_ispc_bindings.h`, including `<stdint.h>`,
//!    `<stdbool.h>` and every per-source header in source order.
//! 2. Hash the aggregate and each header. If `<name>.rs.hash` holds the
//!    same hash and `<name>.rs` exists, stop and report the warnings
//!    recorded beside the hash.
//! 3. Run the declaration extractor on the aggregate and read its JSON AST.
//! 4. Emit `<name>.rs`, then record the hash, the emitter warnings and the
//!    extern function names.
//!
//! The hash is written last, so an interrupted run regenerates next time.

#ifndef SIMDBUILD_BINDINGS_BINDING_BRIDGE_HPP
#define SIMDBUILD_BINDINGS_BINDING_BRIDGE_HPP

#include "simdbuild/build/build_env.hpp"
#include "simdbuild/build/build_error.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace simdbuild::bindings {

struct BindingModule {
    fs::path path;
    std::string text;
    size_t declaration_count = 0;
    std::vector<std::string> warnings;
    std::string header_hash;
    bool regenerated = false;
};

struct BindingRequest {
    std::string name;
    fs::path out_dir;
    std::vector<fs::path> headers;
    /// Sorted symbols the library defines. Empty disables the missing-symbol check.
    std::vector<std::string> library_symbols;
};

/// `_<name>_ispc_bindings.h`
[[nodiscard]] auto aggregate_header_name(const std::string& name) -> std::string;

/// Arguments passed to the extractor for `header`.
[[nodiscard]] auto extractor_arguments(const fs::path& header) -> std::vector<std::string>;

class BindingBridge {
public:
    explicit BindingBridge(build::BuildEnv env);

    [[nodiscard]] auto generate(const BindingRequest& request)
        -> build::BuildResult<BindingModule>;

private:
    build::BuildEnv env_;
};

} // namespace simdbuild::bindings

#endif // SIMDBUILD_BINDINGS_BINDING_BRIDGE_HPP
