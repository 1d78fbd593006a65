#include "simdbuild/runtime/artifact_locator.hpp"

#include "simdbuild/build/object_file.hpp"
#include "simdbuild/log/log.hpp"

#include <sstream>
#include <system_error>
#include <utility>

namespace simdbuild::runtime {

ArtifactLocator::ArtifactLocator(std::string name, build::BuildEnv env)
    : name_(std::move(name)), env_(std::move(env)) {}

auto ArtifactLocator::search_path(const fs::path& dir) -> ArtifactLocator& {
    explicit_dirs_.push_back(env_.absolute(dir));
    return *this;
}

auto ArtifactLocator::target(std::string triple) -> ArtifactLocator& {
    triple_ = std::move(triple);
    return *this;
}

auto ArtifactLocator::resolved_triple() const -> std::string {
    if (!triple_.empty()) {
        return triple_;
    }
    if (!env_.target.empty()) {
        return env_.target;
    }
    return build::default_target_triple();
}

auto ArtifactLocator::search_dirs() const -> std::vector<fs::path> {
    std::vector<fs::path> dirs = explicit_dirs_;
    for (const auto& dir : build::split_path_list(env_.prebuilt_path)) {
        dirs.push_back(env_.absolute(dir));
    }
    dirs.push_back(env_.absolute("prebuilt"));
    return dirs;
}

auto ArtifactLocator::locate() const -> build::BuildResult<LocatedArtifact> {
    auto triple = resolved_triple();
    auto dirs = search_dirs();

    for (const auto& dir : dirs) {
        for (auto kind : {build::LibraryKind::Static, build::LibraryKind::Shared}) {
            auto candidate = dir / build::library_file_name(name_, triple, kind);
            std::error_code ec;
            if (!fs::is_regular_file(candidate, ec)) {
                SIMDBUILD_LOG_TRACE("locate", "no " << candidate.string());
                continue;
            }

            LocatedArtifact artifact;
            artifact.library = candidate;
            artifact.kind = kind;
            artifact.directory = dir;

            build::Library library;
            library.path = candidate;
            library.kind = kind;
            library.link_name = build::library_link_name(name_, triple);
            artifact.directives = build::directives_for_library(library, dir);
            artifact.directives.watch(candidate);

            auto bindings = dir / (name_ + ".rs");
            if (fs::is_regular_file(bindings, ec)) {
                artifact.bindings = bindings;
                artifact.directives.watch(bindings);
            }
            SIMDBUILD_LOG_INFO("locate", "Using prebuilt " << candidate.string());
            return artifact;
        }
    }

    std::ostringstream searched;
    for (const auto& dir : dirs) {
        searched << "  " << dir.string() << "\n";
    }
    return build::make_error(build::ErrorKind::ArtifactNotFound,
                             "No prebuilt library '" + name_ + "' for target " + triple,
                             "Searched:\n" + searched.str());
}

} // namespace simdbuild::runtime
