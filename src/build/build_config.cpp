#include "simdbuild/build/build_config.hpp"

#include "simdbuild/build/compiler_invoker.hpp"
#include "simdbuild/build/dependency_tracker.hpp"
#include "simdbuild/build/object_file.hpp"
#include "simdbuild/build/process.hpp"
#include "simdbuild/log/log.hpp"
#include "simdbuild/target/host_cpu.hpp"

#include <algorithm>
#include <chrono>
#include <iostream>
#include <regex>
#include <system_error>
#include <thread>

namespace simdbuild::build {

// ============================================================================
// Helpers
// ============================================================================

auto CompilerVersion::to_string() const -> std::string {
    return std::to_string(major) + "." + std::to_string(minor) + "." + std::to_string(patch);
}

auto parse_compiler_version(std::string_view output) -> std::optional<CompilerVersion> {
    // "Intel(r) Implicit SPMD Program Compiler (Intel(r) ISPC), 1.21.0 (build ...)"
    // "Intel(r) SPMD Program Compiler (ispc), 1.9.1 (build ...)"
    static const std::regex pattern(R"(\((?:ispc|Intel\(r\) ISPC)\),\s*(\d+)\.(\d+)\.(\d+))");
    std::string text(output);
    std::smatch match;
    if (!std::regex_search(text, match, pattern)) {
        return std::nullopt;
    }
    CompilerVersion version;
    version.major = std::stoi(match[1].str());
    version.minor = std::stoi(match[2].str());
    version.patch = std::stoi(match[3].str());
    return version;
}

bool is_identifier(std::string_view name) {
    if (name.empty()) {
        return false;
    }
    auto is_start = [](char c) {
        return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || c == '_';
    };
    if (!is_start(name.front())) {
        return false;
    }
    return std::all_of(name.begin() + 1, name.end(),
                       [&](char c) { return is_start(c) || (c >= '0' && c <= '9'); });
}

// ============================================================================
// Setters
// ============================================================================

BuildConfig::BuildConfig(BuildEnv env) : env_(std::move(env)) {}

void BuildConfig::fail(std::string message) {
    SIMDBUILD_LOG_DEBUG("config", message);
    if (!error_) {
        error_ = make_error(ErrorKind::Configuration, std::move(message));
    }
}

auto BuildConfig::file(const fs::path& source) -> BuildConfig& {
    auto stem = source.stem().string();
    if (stem.empty()) {
        fail("Source '" + source.string() + "' has no file name");
        return *this;
    }
    if (!stems_.insert(stem).second) {
        fail("Duplicate source stem '" + stem + "' (" + source.string() +
             "): outputs would overwrite each other");
        return *this;
    }
    sources_.push_back(source);
    return *this;
}

auto BuildConfig::files(const std::vector<fs::path>& sources) -> BuildConfig& {
    for (const auto& source : sources) {
        file(source);
    }
    return *this;
}

auto BuildConfig::out_dir(const fs::path& dir) -> BuildConfig& {
    out_dir_ = dir;
    return *this;
}

auto BuildConfig::library_kind(LibraryKind kind) -> BuildConfig& {
    library_kind_ = kind;
    return *this;
}

auto BuildConfig::cargo_metadata(bool enabled) -> BuildConfig& {
    cargo_metadata_ = enabled;
    return *this;
}

auto BuildConfig::jobs(size_t count) -> BuildConfig& {
    jobs_ = count;
    return *this;
}

auto BuildConfig::debug(bool enabled) -> BuildConfig& {
    debug_ = enabled;
    return *this;
}

auto BuildConfig::opt_level(int level) -> BuildConfig& {
    if (level < 0 || level > 3) {
        fail("Optimization level " + std::to_string(level) + " is outside 0..3");
        return *this;
    }
    opt_level_ = level;
    return *this;
}

auto BuildConfig::target(const std::string& triple) -> BuildConfig& {
    target_ = triple;
    return *this;
}

auto BuildConfig::target_isa(TargetIsa isa) -> BuildConfig& {
    auto flag = std::string(target::isa_flag(isa));
    if (std::find(isas_.begin(), isas_.end(), isa) != isas_.end()) {
        fail("Target ISA '" + flag + "' requested twice");
        return *this;
    }
    if (!isas_.empty() && (isa == TargetIsa::Host || isas_.front() == TargetIsa::Host)) {
        fail("Target ISA 'host' cannot be combined with other targets");
        return *this;
    }
    for (auto existing : isas_) {
        if (target::isa_suffix(existing) == target::isa_suffix(isa)) {
            fail("Target ISAs '" + std::string(target::isa_flag(existing)) + "' and '" + flag +
                 "' would both write the '" + std::string(target::isa_suffix(isa)) +
                 "' object");
            return *this;
        }
    }
    isas_.push_back(isa);
    return *this;
}

auto BuildConfig::target_isas(const std::vector<TargetIsa>& isas) -> BuildConfig& {
    if (isas.empty()) {
        fail("Empty target ISA list");
        return *this;
    }
    for (auto isa : isas) {
        target_isa(isa);
    }
    return *this;
}

auto BuildConfig::math_lib(MathLib lib) -> BuildConfig& {
    math_lib_ = lib;
    return *this;
}

auto BuildConfig::addressing(Addressing addressing) -> BuildConfig& {
    addressing_ = addressing;
    return *this;
}

auto BuildConfig::architecture(Architecture arch) -> BuildConfig& {
    architecture_ = arch;
    return *this;
}

auto BuildConfig::cpu(Cpu cpu) -> BuildConfig& {
    cpu_ = cpu;
    return *this;
}

auto BuildConfig::target_os(TargetOs os) -> BuildConfig& {
    target_os_ = os;
    return *this;
}

auto BuildConfig::optimization_opt(OptimizationOpt opt) -> BuildConfig& {
    if (std::find(optimization_opts_.begin(), optimization_opts_.end(), opt) ==
        optimization_opts_.end()) {
        optimization_opts_.push_back(opt);
    }
    return *this;
}

auto BuildConfig::force_alignment(uint32_t alignment) -> BuildConfig& {
    if (alignment == 0 || (alignment & (alignment - 1)) != 0) {
        fail("Forced alignment " + std::to_string(alignment) + " is not a power of two");
        return *this;
    }
    force_alignment_ = alignment;
    return *this;
}

auto BuildConfig::pic(bool enabled) -> BuildConfig& {
    pic_ = enabled;
    return *this;
}

auto BuildConfig::add_define(const std::string& name, std::optional<std::string> value)
    -> BuildConfig& {
    if (!is_identifier(name)) {
        fail("Define name '" + name + "' is not an identifier");
        return *this;
    }
    defines_.push_back(Define{name, std::move(value)});
    return *this;
}

auto BuildConfig::include_path(const fs::path& dir) -> BuildConfig& {
    include_paths_.push_back(env_.absolute(dir));
    return *this;
}

auto BuildConfig::no_omit_frame_pointer() -> BuildConfig& {
    no_omit_frame_pointer_ = true;
    return *this;
}

auto BuildConfig::no_stdlib() -> BuildConfig& {
    no_stdlib_ = true;
    return *this;
}

auto BuildConfig::no_cpp() -> BuildConfig& {
    no_cpp_ = true;
    return *this;
}

auto BuildConfig::quiet() -> BuildConfig& {
    quiet_ = true;
    return *this;
}

auto BuildConfig::werror() -> BuildConfig& {
    werror_ = true;
    return *this;
}

auto BuildConfig::woff() -> BuildConfig& {
    woff_ = true;
    return *this;
}

auto BuildConfig::wno_perf() -> BuildConfig& {
    wno_perf_ = true;
    return *this;
}

auto BuildConfig::instrument() -> BuildConfig& {
    instrument_ = true;
    return *this;
}

auto BuildConfig::extra_flag(const std::string& flag) -> BuildConfig& {
    extra_flags_.push_back(flag);
    return *this;
}

// ============================================================================
// Resolved Settings
// ============================================================================

int BuildConfig::effective_opt_level() const {
    if (opt_level_) {
        return *opt_level_;
    }
    auto from_env = env_.default_opt_level();
    return from_env ? *from_env : 2;
}

bool BuildConfig::effective_debug() const {
    return debug_ ? *debug_ : env_.default_debug();
}

std::string BuildConfig::effective_triple() const {
    if (!target_.empty()) {
        return target_;
    }
    if (!env_.target.empty()) {
        return env_.target;
    }
    return default_target_triple();
}

fs::path BuildConfig::effective_out_dir() const {
    if (!out_dir_.empty()) {
        return env_.absolute(out_dir_);
    }
    if (!env_.out_dir.empty()) {
        return env_.absolute(env_.out_dir);
    }
    return {};
}

bool BuildConfig::effective_pic() const {
    return pic_ ? *pic_ : !target::is_windows_triple(effective_triple());
}

size_t BuildConfig::effective_jobs() const {
    if (jobs_ == 0) {
        return std::max(1u, std::thread::hardware_concurrency());
    }
    return jobs_;
}

auto BuildConfig::validate() const -> MaybeError {
    if (error_) {
        return error_;
    }
    if (sources_.empty()) {
        return make_error(ErrorKind::Configuration, "No source files to compile");
    }
    int level = effective_opt_level();
    if (level < 0 || level > 3) {
        return make_error(ErrorKind::Configuration,
                          "OPT_LEVEL " + std::to_string(level) + " is outside 0..3");
    }
    if (effective_debug() && sources_.size() > 1 && isas_.size() > 1 &&
        target::is_windows_triple(effective_triple())) {
        return make_error(ErrorKind::Configuration,
                          "Debug symbols with several sources and several target ISAs are not "
                          "supported on " + effective_triple());
    }
    return std::nullopt;
}

auto BuildConfig::compiler_arguments() const -> std::vector<std::string> {
    std::vector<std::string> args;
    int level = effective_opt_level();

    if (cpu_ == Cpu::Generic && level == 0) {
        SIMDBUILD_LOG_WARN("config", "Omitting -O0 for cpu=generic, the compiler crashes on it");
    } else {
        args.push_back("-O" + std::to_string(level));
    }
    if (effective_debug()) {
        args.push_back("-g");
    }
    if (effective_pic()) {
        args.push_back("--pic");
    }

    auto arch = architecture_ ? architecture_ : target::architecture_for_triple(effective_triple());
    if (arch) {
        args.emplace_back(target::architecture_flag(*arch));
    }
    for (const auto& define : defines_) {
        args.push_back("-D" + define.name + (define.value ? "=" + *define.value : ""));
    }
    args.emplace_back(target::math_lib_flag(math_lib_));
    if (addressing_) {
        args.emplace_back(target::addressing_flag(*addressing_));
    }
    if (force_alignment_) {
        args.push_back("--force-alignment=" + std::to_string(*force_alignment_));
    }
    for (auto opt : optimization_opts_) {
        args.emplace_back(target::optimization_flag(opt));
    }
    for (const auto& dir : include_paths_) {
        args.push_back("-I" + dir.string());
    }

    const std::pair<bool, const char*> switches[] = {
        {no_omit_frame_pointer_, "--no-omit-frame-pointer"},
        {no_stdlib_, "--nostdlib"},
        {no_cpp_, "--nocpp"},
        {quiet_, "--quiet"},
        {werror_, "--werror"},
        {woff_, "--woff"},
        {wno_perf_, "--wno-perf"},
        {instrument_, "--instrument"},
    };
    for (const auto& [enabled, flag] : switches) {
        if (enabled) {
            args.emplace_back(flag);
        }
    }

    if (!isas_.empty()) {
        args.push_back("--target=" + target::join_isa_flags(isas_));
    }
    if (cpu_) {
        args.emplace_back(target::cpu_flag(*cpu_));
    }
    if (target_os_) {
        args.emplace_back(target::target_os_flag(*target_os_));
    }
    for (const auto& flag : extra_flags_) {
        args.push_back(flag);
    }
    return args;
}

// ============================================================================
// Compiler Version
// ============================================================================

auto BuildConfig::query_version(const fs::path& compiler) const -> BuildResult<CompilerVersion> {
    auto result = run_process(compiler, {"--version"}, env_.cwd);
    if (!result.launched) {
        return make_error(ErrorKind::ToolNotFound, "Failed to run " + compiler.string(),
                          result.stderr_output);
    }
    if (!result.success()) {
        return make_error(ErrorKind::ToolNotFound,
                          "Failed to get the compiler version from " + compiler.string(),
                          result.stderr_output);
    }
    auto version = parse_compiler_version(result.stdout_output);
    if (!version) {
        return make_error(ErrorKind::Configuration,
                          "Cannot parse the compiler version of " + compiler.string(),
                          result.stdout_output);
    }
    return *version;
}

auto BuildConfig::check_version(const CompilerVersion& version) const -> MaybeError {
    if (instrument_ && version < INSTRUMENT_MIN_VERSION) {
        return make_error(ErrorKind::Configuration,
                          "Instrumentation requires compiler " +
                              INSTRUMENT_MIN_VERSION.to_string() + " or newer, found " +
                              version.to_string());
    }
    bool disable_zmm = std::find(optimization_opts_.begin(), optimization_opts_.end(),
                                 OptimizationOpt::DisableZmm) != optimization_opts_.end();
    if (disable_zmm && version < DISABLE_ZMM_MIN_VERSION) {
        return make_error(ErrorKind::Configuration,
                          "disable-zmm requires compiler " + DISABLE_ZMM_MIN_VERSION.to_string() +
                              " or newer, found " + version.to_string());
    }
    return std::nullopt;
}

// ============================================================================
// Pipeline
// ============================================================================

auto BuildConfig::compile(const std::string& name) -> BuildResult<BuildOutput> {
    auto start = std::chrono::steady_clock::now();
    init_logging(env_);
    install_interrupt_handlers();

    if (auto err = validate()) {
        return *err;
    }
    if (!is_identifier(name)) {
        return make_error(ErrorKind::Configuration,
                          "Library name '" + name + "' is not an identifier");
    }
    auto out_dir = effective_out_dir();
    if (out_dir.empty()) {
        return make_error(ErrorKind::Configuration,
                          "No output directory: call out_dir() or set OUT_DIR");
    }

    auto compiler = find_executable(env_.compiler, env_.search_path());
    if (!compiler) {
        return make_error(ErrorKind::ToolNotFound,
                          "Cannot find SIMD compiler '" + env_.compiler + "'",
                          "Install it on PATH or set SIMDBUILD_COMPILER");
    }
    auto version = query_version(*compiler);
    if (is_err(version)) {
        return unwrap_err(version);
    }
    if (auto err = check_version(unwrap(version))) {
        return *err;
    }
    SIMDBUILD_LOG_INFO("config", "Using " << compiler->string() << " "
                                          << unwrap(version).to_string());

    if (!isas_.empty()) {
        auto selected = target::select_isa(isas_);
        if (selected) {
            SIMDBUILD_LOG_INFO("config", "This host would run the '"
                                             << target::isa_flag(*selected) << "' variant");
        } else {
            SIMDBUILD_LOG_WARN("config", "This host supports none of the requested targets");
        }
    }

    std::error_code ec;
    fs::create_directories(out_dir, ec);
    if (ec) {
        return make_error(ErrorKind::Io, "Cannot create output directory " + out_dir.string(),
                          ec.message());
    }

    // ========================================================================
    // Classify and compile
    // ========================================================================

    auto args = compiler_arguments();
    std::vector<std::string> fingerprint_parts{compiler->string(), unwrap(version).to_string()};
    fingerprint_parts.insert(fingerprint_parts.end(), args.begin(), args.end());
    fs::path working_dir = env_.cwd.empty() ? fs::current_path(ec) : env_.cwd;
    DependencyTracker tracker(compute_fingerprint(fingerprint_parts), working_dir);

    std::vector<fs::path> sources;
    for (const auto& source : sources_) {
        sources.push_back(env_.absolute(source));
    }
    auto plans = plan_sources(sources, isas_, out_dir);

    BuildOutput output;
    std::vector<const SourcePlan*> stale;
    for (const auto& plan : plans) {
        auto classification = tracker.classify(plan);
        if (classification.is_fresh()) {
            SIMDBUILD_LOG_DEBUG("deps", plan.source.string() << " is up to date");
            ++output.stats.sources_reused;
        } else {
            SIMDBUILD_LOG_DEBUG("deps", plan.source.string() << " is stale: "
                                                             << classification.reason);
            stale.push_back(&plan);
        }
        output.stats.units_total += plan.units.size();
        output.units.insert(output.units.end(), plan.units.begin(), plan.units.end());
    }

    CompilerInvoker invoker(*compiler, args, target::join_isa_flags(isas_), working_dir,
                            effective_jobs());
    auto invoked = invoker.compile(stale, tracker);
    if (is_err(invoked)) {
        return unwrap_err(invoked);
    }
    output.stats.sources_compiled = unwrap(invoked).compiled;

    // ========================================================================
    // Archive and bindings
    // ========================================================================

    auto artifacts = collect_artifacts(plans);
    if (is_err(artifacts)) {
        return unwrap_err(artifacts);
    }

    ArchiveRequest request;
    request.name = name;
    request.triple = effective_triple();
    request.kind = library_kind_;
    request.out_dir = out_dir;
    request.members = std::move(unwrap(artifacts));
    request.force = output.stats.sources_compiled > 0;

    Archiver archiver(env_);
    auto library = archiver.create(request);
    if (is_err(library)) {
        return unwrap_err(library);
    }
    output.library = std::move(unwrap(library));

    bindings::BindingRequest binding_request;
    binding_request.name = name;
    binding_request.out_dir = out_dir;
    for (const auto& plan : plans) {
        binding_request.headers.push_back(plan.header);
    }
    binding_request.library_symbols = output.library.defined_symbols;

    bindings::BindingBridge bridge(env_);
    auto module = bridge.generate(binding_request);
    if (is_err(module)) {
        return unwrap_err(module);
    }
    output.bindings = std::move(unwrap(module));

    // ========================================================================
    // Directives
    // ========================================================================

    output.directives = directives_for_library(output.library, out_dir);
    for (const auto& plan : plans) {
        output.directives.watch(plan.source);
        for (const auto& dep : tracker.dependencies_of(plan)) {
            output.directives.watch(dep);
        }
    }
    output.directives.warnings = output.bindings.warnings;
    if (cargo_metadata_) {
        emit_cargo_metadata(output.directives, std::cout);
    }

    output.compiler_version = unwrap(version);
    output.stats.elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                                  std::chrono::steady_clock::now() - start)
                                  .count();
    SIMDBUILD_LOG_INFO("config", "Built " << output.library.path.string() << ": "
                                          << output.stats.sources_compiled << " compiled, "
                                          << output.stats.sources_reused << " reused in "
                                          << output.stats.elapsed_ms << " ms");
    return output;
}

} // namespace simdbuild::build
