#include "simdbuild/build/link_directives.hpp"

#include <algorithm>
#include <sstream>

namespace simdbuild::build {

void LinkDirectives::watch(const fs::path& path) {
    if (std::find(rerun_if_changed.begin(), rerun_if_changed.end(), path) ==
        rerun_if_changed.end()) {
        rerun_if_changed.push_back(path);
    }
}

auto directives_for_library(const Library& library, const fs::path& dir) -> LinkDirectives {
    LinkDirectives directives;
    directives.link_libs.push_back(
        (library.kind == LibraryKind::Static ? "static=" : "dylib=") + library.link_name);
    directives.link_search.push_back(dir);
    directives.env.emplace_back(OUT_DIR_VARIABLE, dir.string());
    return directives;
}

auto render_cargo_metadata(const LinkDirectives& directives) -> std::string {
    std::ostringstream out;
    for (const auto& warning : directives.warnings) {
        // One directive per line; multi-line warnings are split.
        std::istringstream lines(warning);
        std::string line;
        while (std::getline(lines, line)) {
            out << "cargo:warning=" << line << "\n";
        }
    }
    for (const auto& path : directives.rerun_if_changed) {
        out << "cargo:rerun-if-changed=" << path.string() << "\n";
    }
    for (const auto& lib : directives.link_libs) {
        out << "cargo:rustc-link-lib=" << lib << "\n";
    }
    for (const auto& dir : directives.link_search) {
        out << "cargo:rustc-link-search=native=" << dir.string() << "\n";
    }
    for (const auto& [key, value] : directives.env) {
        out << "cargo:rustc-env=" << key << "=" << value << "\n";
    }
    return out.str();
}

void emit_cargo_metadata(const LinkDirectives& directives, std::ostream& out) {
    out << render_cargo_metadata(directives);
    out.flush();
}

} // namespace simdbuild::build
