//! # Dependency Tracker
//!
//! Record persistence, dependency-file parsing and the freshness check.

#include "simdbuild/build/dependency_tracker.hpp"

#include "simdbuild/common.hpp"
#include "simdbuild/log/log.hpp"

#include <algorithm>
#include <charconv>
#include <chrono>
#include <fstream>
#include <sstream>
#include <system_error>
#include <unordered_set>

namespace simdbuild::build {

static constexpr std::string_view RECORD_HEADER = "simdbuild-deprec|1";

auto file_mtime(const fs::path& path) -> std::optional<int64_t> {
    std::error_code ec;
    auto time = fs::last_write_time(path, ec);
    if (ec) {
        return std::nullopt;
    }
    return std::chrono::duration_cast<std::chrono::nanoseconds>(time.time_since_epoch()).count();
}

static std::optional<std::string> read_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::nullopt;
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

static std::string_view trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t' || s.front() == '\r')) {
        s.remove_prefix(1);
    }
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r')) {
        s.remove_suffix(1);
    }
    return s;
}

// ============================================================================
// Dependency Files
// ============================================================================

/// Splits one logical make line into words, honoring `\ ` and `$$`.
static std::vector<std::string> make_words(std::string_view line) {
    std::vector<std::string> words;
    std::string current;
    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (c == '\\' && i + 1 < line.size() && line[i + 1] == ' ') {
            current += ' ';
            ++i;
        } else if (c == '$' && i + 1 < line.size() && line[i + 1] == '$') {
            current += '$';
            ++i;
        } else if (c == ' ' || c == '\t' || c == '\r') {
            if (!current.empty()) {
                words.push_back(std::move(current));
                current.clear();
            }
        } else {
            current += c;
        }
    }
    if (!current.empty()) {
        words.push_back(std::move(current));
    }
    return words;
}

auto parse_dep_file(std::string_view content, const fs::path& base_dir) -> std::vector<fs::path> {
    // Join backslash-newline continuations into logical lines.
    std::vector<std::string> lines;
    std::string current;
    for (size_t i = 0; i < content.size(); ++i) {
        char c = content[i];
        if (c == '\\' && i + 1 < content.size() &&
            (content[i + 1] == '\n' || (content[i + 1] == '\r' && i + 2 < content.size() &&
                                        content[i + 2] == '\n'))) {
            current += ' ';
            i += content[i + 1] == '\r' ? 2 : 1;
        } else if (c == '\n') {
            lines.push_back(std::move(current));
            current.clear();
        } else {
            current += c;
        }
    }
    if (!current.empty()) {
        lines.push_back(std::move(current));
    }

    bool make_style = false;
    for (const auto& line : lines) {
        for (const auto& word : make_words(line)) {
            if (word.size() > 1 && word.back() == ':') {
                make_style = true;
                break;
            }
        }
        if (make_style) {
            break;
        }
    }

    std::vector<fs::path> out;
    std::unordered_set<std::string> seen;
    auto add = [&](std::string_view raw) {
        if (raw.empty()) {
            return;
        }
        fs::path p(raw);
        if (p.is_relative()) {
            p = base_dir / p;
        }
        p = p.lexically_normal();
        if (seen.insert(p.string()).second) {
            out.push_back(std::move(p));
        }
    };

    for (const auto& line : lines) {
        if (!make_style) {
            add(trim(line));
            continue;
        }
        auto words = make_words(line);
        bool after_target = false;
        for (const auto& word : words) {
            if (!after_target) {
                if (word.back() == ':') {
                    after_target = true;
                }
                continue;
            }
            add(word);
        }
    }
    return out;
}

// ============================================================================
// Record Persistence
// ============================================================================

/// Parses `<mtime>|<path>`.
static std::optional<FileStamp> parse_stamp(std::string_view rest) {
    size_t bar = rest.find('|');
    if (bar == std::string_view::npos || bar + 1 >= rest.size()) {
        return std::nullopt;
    }
    FileStamp stamp;
    auto digits = rest.substr(0, bar);
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), stamp.mtime_ns);
    if (ec != std::errc() || ptr != digits.data() + digits.size()) {
        return std::nullopt;
    }
    stamp.path = fs::path(std::string(rest.substr(bar + 1)));
    return stamp;
}

auto load_record(const fs::path& path) -> std::optional<DependencyRecord> {
    auto content = read_file(path);
    if (!content) {
        return std::nullopt;
    }

    DependencyRecord record;
    bool has_header = false;
    bool has_source = false;
    bool has_fingerprint = false;

    std::istringstream in(*content);
    std::string line;
    while (std::getline(in, line)) {
        if (line.empty()) {
            continue;
        }
        if (!has_header) {
            if (line != RECORD_HEADER) {
                return std::nullopt;
            }
            has_header = true;
            continue;
        }
        size_t bar = line.find('|');
        if (bar == std::string::npos) {
            return std::nullopt;
        }
        std::string_view tag(line.data(), bar);
        std::string_view rest(line.data() + bar + 1, line.size() - bar - 1);

        if (tag == "fingerprint") {
            record.fingerprint = std::string(rest);
            has_fingerprint = true;
            continue;
        }
        auto stamp = parse_stamp(rest);
        if (!stamp) {
            return std::nullopt;
        }
        if (tag == "source") {
            record.source = std::move(*stamp);
            has_source = true;
        } else if (tag == "dep") {
            record.dependencies.push_back(std::move(*stamp));
        } else if (tag == "output") {
            record.outputs.push_back(std::move(*stamp));
        } else {
            return std::nullopt;
        }
    }

    if (!has_header || !has_source || !has_fingerprint || record.outputs.empty()) {
        return std::nullopt;
    }
    return record;
}

auto save_record(const fs::path& path, const DependencyRecord& record) -> MaybeError {
    auto tmp = path;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            return make_error(ErrorKind::Io, "Cannot write dependency record " + tmp.string());
        }
        out << RECORD_HEADER << "\n";
        out << "fingerprint|" << record.fingerprint << "\n";
        out << "source|" << record.source.mtime_ns << "|" << record.source.path.string() << "\n";
        for (const auto& dep : record.dependencies) {
            out << "dep|" << dep.mtime_ns << "|" << dep.path.string() << "\n";
        }
        for (const auto& output : record.outputs) {
            out << "output|" << output.mtime_ns << "|" << output.path.string() << "\n";
        }
        out.flush();
        if (!out) {
            return make_error(ErrorKind::Io, "Cannot write dependency record " + tmp.string());
        }
    }
    std::error_code ec;
    fs::rename(tmp, path, ec);
    if (ec) {
        fs::remove(tmp, ec);
        return make_error(ErrorKind::Io, "Cannot install dependency record " + path.string());
    }
    return std::nullopt;
}

auto compute_fingerprint(const std::vector<std::string>& parts) -> std::string {
    uint64_t h = FNV_OFFSET_BASIS;
    for (const auto& part : parts) {
        h = fnv1a64_update(h, part);
        h = fnv1a64_update(h, std::string_view("\0", 1));
    }
    return hex16(h);
}

// ============================================================================
// DependencyTracker
// ============================================================================

DependencyTracker::DependencyTracker(std::string fingerprint, fs::path base_dir)
    : fingerprint_(std::move(fingerprint)), base_dir_(std::move(base_dir)) {}

static bool stamp_matches(const FileStamp& stamp, std::string& reason, std::string_view what) {
    auto mtime = file_mtime(stamp.path);
    if (!mtime) {
        reason = std::string(what) + " missing: " + stamp.path.string();
        return false;
    }
    if (*mtime != stamp.mtime_ns) {
        reason = std::string(what) + " changed: " + stamp.path.string();
        return false;
    }
    return true;
}

auto DependencyTracker::classify(const SourcePlan& plan) const -> Classification {
    Classification result;

    auto record = load_record(plan.record);
    if (!record) {
        result.reason = "no usable dependency record";
        return result;
    }
    if (record->fingerprint != fingerprint_) {
        result.reason = "compiler arguments changed";
        return result;
    }
    if (record->source.path != plan.source) {
        result.reason = "record belongs to " + record->source.path.string();
        return result;
    }
    if (!stamp_matches(record->source, result.reason, "source")) {
        return result;
    }
    for (const auto& dep : record->dependencies) {
        if (!stamp_matches(dep, result.reason, "dependency")) {
            return result;
        }
    }
    for (const auto& output : record->outputs) {
        if (!stamp_matches(output, result.reason, "output")) {
            return result;
        }
    }
    // Outputs expected now but absent from the record (e.g. a new ISA).
    for (const auto& expected : plan.expected_outputs()) {
        bool recorded = false;
        for (const auto& output : record->outputs) {
            if (output.path == expected) {
                recorded = true;
                break;
            }
        }
        if (!recorded) {
            result.reason = "output not recorded: " + expected.string();
            return result;
        }
    }

    result.state = Freshness::Fresh;
    result.reason = "up to date";
    return result;
}

auto DependencyTracker::invalidate(const SourcePlan& plan) const -> MaybeError {
    std::error_code ec;
    fs::remove(plan.record, ec);
    if (ec) {
        return make_error(ErrorKind::Io, "Cannot remove dependency record " +
                                             plan.record.string() + ": " + ec.message());
    }
    return std::nullopt;
}

auto DependencyTracker::snapshot(const SourcePlan& plan) const -> BuildResult<CompileSnapshot> {
    CompileSnapshot snap;
    snap.started_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(
                          fs::file_time_type::clock::now().time_since_epoch())
                          .count();

    auto source_mtime = file_mtime(plan.source);
    if (!source_mtime) {
        return make_error(ErrorKind::Io, "Source does not exist: " + plan.source.string());
    }
    snap.source = FileStamp{plan.source, *source_mtime};

    for (auto& dep : dependencies_of(plan)) {
        if (auto mtime = file_mtime(dep)) {
            snap.dependencies.push_back(FileStamp{std::move(dep), *mtime});
        }
    }
    return snap;
}

auto DependencyTracker::record(const SourcePlan& plan, const CompileSnapshot& before) const
    -> MaybeError {
    auto content = read_file(plan.dep_file);
    if (!content) {
        SIMDBUILD_LOG_WARN("deps", "No dependency file for " << plan.source.string()
                                                              << "; it will be recompiled every build");
        return std::nullopt;
    }

    auto source_mtime = file_mtime(plan.source);
    if (!source_mtime) {
        return make_error(ErrorKind::Io, "Source vanished during build: " + plan.source.string());
    }
    if (*source_mtime != before.source.mtime_ns) {
        SIMDBUILD_LOG_WARN("deps", plan.source.string()
                                       << " changed while compiling; it will be recompiled");
        return std::nullopt;
    }

    DependencyRecord record;
    record.fingerprint = fingerprint_;
    record.source = before.source;

    for (auto& dep : parse_dep_file(*content, base_dir_)) {
        if (dep == plan.source) {
            continue;
        }
        auto mtime = file_mtime(dep);
        if (!mtime) {
            // A dependency the compiler reported but we cannot stat: leave
            // the source stale rather than trust an incomplete record.
            SIMDBUILD_LOG_WARN("deps", "Dependency " << dep.string() << " of "
                                                     << plan.source.string()
                                                     << " does not exist; not recording");
            return std::nullopt;
        }

        auto known = std::find_if(before.dependencies.begin(), before.dependencies.end(),
                                  [&](const FileStamp& stamp) { return stamp.path == dep; });
        bool changed = known != before.dependencies.end() ? *mtime != known->mtime_ns
                                                          : *mtime > before.started_ns;
        if (changed) {
            SIMDBUILD_LOG_WARN("deps", "Dependency " << dep.string() << " changed while compiling "
                                                     << plan.source.string()
                                                     << "; it will be recompiled");
            return std::nullopt;
        }
        record.dependencies.push_back(FileStamp{std::move(dep), *mtime});
    }

    for (const auto& output : plan.expected_outputs()) {
        auto mtime = file_mtime(output);
        if (!mtime) {
            return make_error(ErrorKind::Io, "Output vanished during build: " + output.string());
        }
        record.outputs.push_back(FileStamp{output, *mtime});
    }

    SIMDBUILD_LOG_DEBUG("deps", "Recorded " << record.dependencies.size() << " dependencies for "
                                            << plan.source.string());
    return save_record(plan.record, record);
}

auto DependencyTracker::dependencies_of(const SourcePlan& plan) const -> std::vector<fs::path> {
    std::vector<fs::path> out;
    if (auto record = load_record(plan.record)) {
        for (auto& dep : record->dependencies) {
            out.push_back(std::move(dep.path));
        }
        return out;
    }
    if (auto content = read_file(plan.dep_file)) {
        for (auto& dep : parse_dep_file(*content, base_dir_)) {
            if (dep != plan.source) {
                out.push_back(std::move(dep));
            }
        }
    }
    return out;
}

} // namespace simdbuild::build
