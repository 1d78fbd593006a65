#include "simdbuild/build/build_env.hpp"

#include "simdbuild/log/log.hpp"

#include <cstdlib>
#include <mutex>
#include <string>
#include <system_error>

namespace simdbuild::build {

static std::string env_or(const char* name, const std::string& fallback = {}) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : fallback;
}

BuildEnv BuildEnv::from_process() {
    BuildEnv env;
    env.path = env_or("PATH");
    env.compiler = env_or("SIMDBUILD_COMPILER", "ispc");
    env.bindgen = env_or("SIMDBUILD_BINDGEN", "clang");
    env.libclang_path = env_or("LIBCLANG_PATH");
    env.ar = env_or("AR");
    env.cc = env_or("CC");
    env.out_dir = env_or("OUT_DIR");
    env.opt_level = env_or("OPT_LEVEL");
    env.debug = env_or("DEBUG");
    env.target = env_or("TARGET");
    env.host = env_or("HOST");
    env.prebuilt_path = env_or("SIMDBUILD_PREBUILT_PATH");
    env.log_spec = env_or("SIMDBUILD_LOG");

    std::error_code ec;
    env.cwd = fs::current_path(ec);
    return env;
}

std::vector<fs::path> split_path_list(const std::string& list) {
#ifdef _WIN32
    constexpr char separator = ';';
#else
    constexpr char separator = ':';
#endif
    std::vector<fs::path> out;
    size_t pos = 0;
    while (pos <= list.size()) {
        size_t next = list.find(separator, pos);
        if (next == std::string::npos) {
            next = list.size();
        }
        if (next > pos) {
            out.emplace_back(list.substr(pos, next - pos));
        }
        pos = next + 1;
    }
    return out;
}

std::vector<fs::path> BuildEnv::search_path() const {
    return split_path_list(path);
}

std::vector<fs::path> BuildEnv::bindgen_search_path() const {
    auto dirs = split_path_list(libclang_path);
    for (auto& dir : search_path()) {
        dirs.push_back(std::move(dir));
    }
    return dirs;
}

std::optional<int> BuildEnv::default_opt_level() const {
    if (opt_level.empty()) {
        return std::nullopt;
    }
    if (opt_level == "s" || opt_level == "z") {
        return 2;
    }
    int value = 0;
    for (char c : opt_level) {
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        value = value * 10 + (c - '0');
        if (value > 1000) {
            break;
        }
    }
    return value;
}

bool BuildEnv::default_debug() const {
    return debug == "true" || debug == "1";
}

fs::path BuildEnv::absolute(const fs::path& p) const {
    if (p.empty() || p.is_absolute()) {
        return p;
    }
    return (cwd / p).lexically_normal();
}

bool init_logging(const BuildEnv& env) {
    static std::mutex mutex;
    static std::string applied;

    if (env.log_spec.empty()) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex);
    if (env.log_spec == applied) {
        return false;
    }
    log::Logger::init(log::config_from_spec(env.log_spec));
    applied = env.log_spec;
    return true;
}

} // namespace simdbuild::build
