#include "simdbuild/bindings/binding_bridge.hpp"

#include "simdbuild/bindings/clang_ast_reader.hpp"
#include "simdbuild/bindings/rust_emitter.hpp"
#include "simdbuild/build/process.hpp"
#include "simdbuild/json/json.hpp"
#include "simdbuild/log/log.hpp"

#include <algorithm>
#include <charconv>
#include <fstream>
#include <optional>
#include <sstream>
#include <system_error>
#include <utility>

namespace simdbuild::bindings {

using build::ErrorKind;
using build::make_error;

namespace {

std::optional<std::string> read_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::nullopt;
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

build::MaybeError write_file(const fs::path& path, const std::string& content) {
    auto tmp = path;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        out << content;
        if (!out) {
            return make_error(ErrorKind::Io, "Cannot write " + tmp.string());
        }
    }
    std::error_code ec;
    fs::rename(tmp, path, ec);
    if (ec) {
        fs::remove(tmp, ec);
        return make_error(ErrorKind::Io, "Cannot write " + path.string(), ec.message());
    }
    return std::nullopt;
}

/// Writes `path` only when its content differs, keeping its mtime stable.
build::MaybeError write_if_changed(const fs::path& path, const std::string& content) {
    auto existing = read_file(path);
    if (existing && *existing == content) {
        return std::nullopt;
    }
    return write_file(path, content);
}

/// Contents of `<name>.rs.hash`:
///
/// ```text
/// <hash>|<declaration count>
/// warning|<emitter warning>
/// fn|<extern function name>
/// ```
struct HashRecord {
    std::string hash;
    size_t declaration_count = 0;
    std::vector<std::string> warnings;
    std::vector<std::string> functions;
};

std::optional<HashRecord> load_hash(const fs::path& path) {
    auto content = read_file(path);
    if (!content) {
        return std::nullopt;
    }
    std::istringstream lines(*content);
    std::string line;
    if (!std::getline(lines, line)) {
        return std::nullopt;
    }
    auto bar = line.find('|');
    if (bar == std::string::npos) {
        return std::nullopt;
    }
    HashRecord record;
    record.hash = line.substr(0, bar);
    auto count = std::string_view(line).substr(bar + 1);
    auto [ptr, ec] = std::from_chars(count.data(), count.data() + count.size(),
                                     record.declaration_count);
    if (ec != std::errc() || ptr != count.data() + count.size()) {
        return std::nullopt;
    }

    while (std::getline(lines, line)) {
        if (line.starts_with("warning|")) {
            record.warnings.push_back(line.substr(8));
        } else if (line.starts_with("fn|")) {
            record.functions.push_back(line.substr(3));
        } else if (!line.empty()) {
            return std::nullopt;
        }
    }
    return record;
}

std::string hash_text(const HashRecord& record) {
    std::string text = record.hash + "|" + std::to_string(record.declaration_count) + "\n";
    for (const auto& warning : record.warnings) {
        std::string flat = warning;
        std::replace(flat.begin(), flat.end(), '\n', ' ');
        text += "warning|" + flat + "\n";
    }
    for (const auto& fn : record.functions) {
        text += "fn|" + fn + "\n";
    }
    return text;
}

/// Functions the bindings declare that the library does not define.
std::vector<std::string> missing_symbol_warnings(const std::vector<std::string>& functions,
                                                 const std::vector<std::string>& symbols) {
    std::vector<std::string> warnings;
    if (symbols.empty()) {
        return warnings;
    }
    for (const auto& fn : functions) {
        bool defined = std::binary_search(symbols.begin(), symbols.end(), fn) ||
                       std::binary_search(symbols.begin(), symbols.end(), "_" + fn);
        if (!defined) {
            warnings.push_back("function '" + fn + "' is declared but not defined in the library");
        }
    }
    return warnings;
}

} // namespace

auto aggregate_header_name(const std::string& name) -> std::string {
    return "_" + name + "_ispc_bindings.h";
}

auto extractor_arguments(const fs::path& header) -> std::vector<std::string> {
    return {"-x", "c", "-fsyntax-only", "-Xclang", "-ast-dump=json", header.string()};
}

BindingBridge::BindingBridge(build::BuildEnv env) : env_(std::move(env)) {}

auto BindingBridge::generate(const BindingRequest& request) -> build::BuildResult<BindingModule> {
    BindingModule module;
    module.path = request.out_dir / (request.name + ".rs");
    auto hash_path = request.out_dir / (request.name + ".rs.hash");
    auto aggregate_path = request.out_dir / aggregate_header_name(request.name);

    // ========================================================================
    // Aggregate header and content hash
    // ========================================================================

    std::string aggregate = "#include <stdint.h>\n#include <stdbool.h>\n";
    for (const auto& header : request.headers) {
        aggregate += "#include \"" + header.string() + "\"\n";
    }
    if (auto err = write_if_changed(aggregate_path, aggregate)) {
        return *err;
    }

    uint64_t h = FNV_OFFSET_BASIS;
    h = fnv1a64_update(h, EMITTER_VERSION);
    h = fnv1a64_update(h, std::string_view("\0", 1));
    h = fnv1a64_update(h, aggregate);
    for (const auto& header : request.headers) {
        auto content = read_file(header);
        if (!content) {
            return make_error(ErrorKind::BindingGeneration,
                              "Cannot read generated header " + header.string());
        }
        h = fnv1a64_update(h, std::string_view("\0", 1));
        h = fnv1a64_update(h, header.string());
        h = fnv1a64_update(h, std::string_view("\0", 1));
        h = fnv1a64_update(h, *content);
    }
    module.header_hash = hex16(h);

    auto recorded = load_hash(hash_path);
    if (recorded && recorded->hash == module.header_hash) {
        if (auto text = read_file(module.path)) {
            SIMDBUILD_LOG_INFO("bindings", "Bindings for '" << request.name
                                                            << "' are up to date");
            module.text = std::move(*text);
            module.declaration_count = recorded->declaration_count;
            module.warnings = std::move(recorded->warnings);
            for (auto& warning :
                 missing_symbol_warnings(recorded->functions, request.library_symbols)) {
                module.warnings.push_back(std::move(warning));
            }
            for (const auto& warning : module.warnings) {
                SIMDBUILD_LOG_WARN("bindings", warning);
            }
            return module;
        }
    }

    // ========================================================================
    // Extraction
    // ========================================================================

    auto extractor = build::find_executable(env_.bindgen, env_.bindgen_search_path());
    if (!extractor) {
        return make_error(ErrorKind::ToolNotFound,
                          "Cannot find declaration extractor '" + env_.bindgen + "'",
                          "Install clang or set SIMDBUILD_BINDGEN / LIBCLANG_PATH");
    }

    auto args = extractor_arguments(aggregate_path);
    SIMDBUILD_LOG_DEBUG("bindings", build::format_command(*extractor, args));
    auto result = build::run_process(*extractor, args, request.out_dir);
    if (!result.launched) {
        return make_error(ErrorKind::ToolNotFound, "Failed to run " + extractor->string(),
                          result.stderr_output);
    }
    if (!result.success()) {
        return make_error(ErrorKind::BindingGeneration,
                          "Declaration extractor failed on " + aggregate_path.string() +
                              " (exit code " + std::to_string(result.exit_code) + ")",
                          result.stderr_output);
    }

    auto ast = json::parse_json(result.stdout_output);
    if (is_err(ast)) {
        return make_error(ErrorKind::BindingGeneration,
                          "Malformed declaration extractor output",
                          unwrap_err(ast).to_string());
    }
    auto decls = read_declarations(unwrap(ast), request.headers);
    if (is_err(decls)) {
        return make_error(ErrorKind::BindingGeneration, "Malformed declaration extractor output",
                          unwrap_err(decls));
    }

    auto rust = emit_rust_module(request.name, unwrap(decls));
    module.text = std::move(rust.text);
    module.declaration_count = rust.declaration_count;
    module.regenerated = true;

    HashRecord record;
    record.hash = module.header_hash;
    record.declaration_count = module.declaration_count;
    record.warnings = rust.warnings;
    record.functions = rust.function_names;

    module.warnings = std::move(rust.warnings);
    for (auto& warning : missing_symbol_warnings(rust.function_names, request.library_symbols)) {
        module.warnings.push_back(std::move(warning));
    }
    for (const auto& warning : module.warnings) {
        SIMDBUILD_LOG_WARN("bindings", warning);
    }

    if (auto err = write_file(module.path, module.text)) {
        return *err;
    }
    if (auto err = write_file(hash_path, hash_text(record))) {
        return *err;
    }
    SIMDBUILD_LOG_INFO("bindings", "Generated " << module.path.string() << " ("
                                                << module.declaration_count << " declarations)");
    return module;
}

} // namespace simdbuild::bindings
