#include "simdbuild/build/archiver.hpp"

#include "simdbuild/build/dependency_tracker.hpp"
#include "simdbuild/build/object_file.hpp"
#include "simdbuild/build/process.hpp"
#include "simdbuild/log/log.hpp"
#include "simdbuild/target/target_isa.hpp"

#include <algorithm>
#include <fstream>
#include <limits>
#include <optional>
#include <sstream>
#include <system_error>
#include <utility>

namespace simdbuild::build {

auto library_link_name(const std::string& name, const std::string& triple) -> std::string {
    return name + triple;
}

auto library_file_name(const std::string& name, const std::string& triple, LibraryKind kind)
    -> std::string {
    auto link_name = library_link_name(name, triple);
    if (target::is_windows_triple(triple)) {
        return link_name + (kind == LibraryKind::Static ? ".lib" : ".dll");
    }
    if (kind == LibraryKind::Shared) {
        return "lib" + link_name + (target::is_apple_triple(triple) ? ".dylib" : ".so");
    }
    return "lib" + link_name + ".a";
}

/// Splits "tool arg arg" as found in AR / CC.
static std::vector<std::string> split_words(const std::string& s) {
    std::vector<std::string> words;
    std::istringstream in(s);
    std::string word;
    while (in >> word) {
        words.push_back(word);
    }
    return words;
}

Archiver::Archiver(BuildEnv env) : env_(std::move(env)) {}

auto Archiver::resolve_tool(const std::string& override_name, const char* fallback) const
    -> BuildResult<fs::path> {
    auto words = split_words(override_name);
    std::string name = words.empty() ? std::string(fallback) : words.front();
    auto found = find_executable(name, env_.search_path());
    if (!found) {
        return make_error(ErrorKind::ToolNotFound,
                          "Cannot find '" + name + "' on the search path");
    }
    return *found;
}

auto Archiver::run_tool(const fs::path& tool, const std::vector<std::string>& args,
                        const fs::path& cwd, const std::string& what) const -> MaybeError {
    auto result = run_process(tool, args, cwd);
    if (!result.launched) {
        return make_error(ErrorKind::ToolNotFound, "Failed to run " + tool.string(),
                          result.stderr_output);
    }
    if (!result.success()) {
        return make_error(ErrorKind::LinkFailure,
                          "Failed to " + what + " (" + tool.filename().string() + " exit code " +
                              std::to_string(result.exit_code) + ")",
                          result.stderr_output);
    }
    if (!result.stderr_output.empty()) {
        SIMDBUILD_LOG_WARN("archive", tool.filename().string() << ": " << result.stderr_output);
    }
    return std::nullopt;
}

auto member_manifest_path(const fs::path& library) -> fs::path {
    auto path = library;
    path += ".members";
    return path;
}

static std::string manifest_text(const std::vector<fs::path>& members) {
    std::string text;
    for (const auto& member : members) {
        text += member.string();
        text += '\n';
    }
    return text;
}

static std::optional<std::string> read_text(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::nullopt;
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

auto Archiver::create(const ArchiveRequest& request) -> BuildResult<Library> {
    Library library;
    library.kind = request.kind;
    library.link_name = library_link_name(request.name, request.triple);
    library.path = request.out_dir / library_file_name(request.name, request.triple, request.kind);
    for (const auto& member : request.members) {
        library.members.push_back(member.object);
    }

    if (request.members.empty()) {
        return make_error(ErrorKind::LinkFailure, "No objects to archive for " + request.name);
    }

    // Validate every member before touching the existing library.
    int64_t newest_member = std::numeric_limits<int64_t>::min();
    for (const auto& member : request.members) {
        const auto& object = member.object;
        auto mtime = file_mtime(object);
        if (!mtime) {
            return make_error(ErrorKind::LinkFailure, "Missing object file " + object.string());
        }
        if (*mtime != member.mtime_ns) {
            return make_error(ErrorKind::LinkFailure,
                              "Object file " + object.string() + " changed after it was compiled");
        }
        newest_member = std::max(newest_member, *mtime);

        auto symbols = read_object_symbols(object);
        if (is_err(symbols)) {
            return make_error(ErrorKind::LinkFailure, "Corrupt object file " + object.string(),
                              unwrap_err(symbols));
        }
        auto& defined = unwrap(symbols).defined;
        SIMDBUILD_LOG_TRACE("archive", object.filename().string()
                                           << ": " << unwrap(symbols).format << ", "
                                           << defined.size() << " defined symbols");
        for (auto& sym : defined) {
            library.defined_symbols.push_back(std::move(sym));
        }
    }
    std::sort(library.defined_symbols.begin(), library.defined_symbols.end());
    library.defined_symbols.erase(
        std::unique(library.defined_symbols.begin(), library.defined_symbols.end()),
        library.defined_symbols.end());

    auto manifest = member_manifest_path(library.path);
    auto members_text = manifest_text(library.members);
    if (!request.force) {
        auto lib_mtime = file_mtime(library.path);
        auto recorded = read_text(manifest);
        if (lib_mtime && *lib_mtime >= newest_member && recorded == members_text) {
            SIMDBUILD_LOG_DEBUG("archive", library.path.string() << " is up to date");
            return library;
        }
    }

    std::error_code ec;
    fs::remove(manifest, ec);
    fs::remove(library.path, ec);
    if (ec) {
        return make_error(ErrorKind::Io, "Cannot remove old library " + library.path.string() +
                                             ": " + ec.message());
    }

    std::vector<std::string> args;
    MaybeError err;
    if (request.kind == LibraryKind::Shared) {
        auto words = split_words(env_.cc);
        auto tool = resolve_tool(env_.cc, "cc");
        if (is_err(tool)) {
            return unwrap_err(tool);
        }
        args.assign(words.begin() + (words.empty() ? 0 : 1), words.end());
        args.push_back("-shared");
        args.push_back("-o");
        args.push_back(library.path.string());
        for (const auto& object : library.members) {
            args.push_back(object.string());
        }
        err = run_tool(unwrap(tool), args, request.out_dir, "link " + library.path.string());
    } else if (target::is_windows_triple(request.triple)) {
        auto tool = resolve_tool({}, "lib.exe");
        if (is_err(tool)) {
            return unwrap_err(tool);
        }
        args.push_back("/NOLOGO");
        args.push_back("/OUT:" + library.path.string());
        for (const auto& object : library.members) {
            args.push_back(object.string());
        }
        err = run_tool(unwrap(tool), args, request.out_dir, "archive " + library.path.string());
    } else {
        auto words = split_words(env_.ar);
        auto tool = resolve_tool(env_.ar, "ar");
        if (is_err(tool)) {
            return unwrap_err(tool);
        }
        args.assign(words.begin() + (words.empty() ? 0 : 1), words.end());
        args.push_back("rcsD");
        args.push_back(library.path.string());
        for (const auto& object : library.members) {
            args.push_back(object.string());
        }
        err = run_tool(unwrap(tool), args, request.out_dir, "archive " + library.path.string());
    }
    if (err) {
        fs::remove(library.path, ec);
        return std::move(*err);
    }
    if (!file_mtime(library.path)) {
        return make_error(ErrorKind::LinkFailure,
                          "Archiver succeeded but " + library.path.string() + " does not exist");
    }

    {
        std::ofstream out(manifest, std::ios::binary | std::ios::trunc);
        out << members_text;
        if (!out) {
            return make_error(ErrorKind::Io, "Cannot write member manifest " + manifest.string());
        }
    }

    SIMDBUILD_LOG_INFO("archive", "Created " << library.path.string() << " from "
                                             << library.members.size() << " objects");
    return library;
}

} // namespace simdbuild::build
