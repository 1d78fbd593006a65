#include "test_support.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <unistd.h>

namespace simdbuild::test {

TempDir::TempDir() {
    auto pattern = (fs::temp_directory_path() / "simdbuild-test-XXXXXX").string();
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');
    if (!mkdtemp(buffer.data())) {
        throw std::runtime_error("mkdtemp failed for " + pattern);
    }
    // Resolve symlinked temp roots so paths compare equal to canonical ones.
    path_ = fs::canonical(buffer.data());
}

TempDir::~TempDir() {
    std::error_code ec;
    fs::remove_all(path_, ec);
}

LogCapture::LogCapture() : sink_(std::make_unique<log::MemorySink>()) {
    auto& logger = log::Logger::instance();
    logger.clear_sinks();
    logger.add_sink(sink_->share());
    logger.set_filter("");
    logger.set_level(log::LogLevel::Trace);
}

LogCapture::~LogCapture() {
    auto& logger = log::Logger::instance();
    logger.clear_sinks();
    logger.set_filter("");
    logger.set_level(log::LogLevel::Warn);
}

void write_file(const fs::path& path, const std::string& content) {
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path());
    }
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

std::string read_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

void write_script(const fs::path& path, const std::string& content) {
    write_file(path, content);
    fs::permissions(path,
                    fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec |
                        fs::perms::others_read | fs::perms::others_exec);
}

size_t count_lines(const fs::path& path) {
    std::ifstream in(path);
    size_t lines = 0;
    std::string line;
    while (std::getline(in, line)) {
        ++lines;
    }
    return lines;
}

void shift_mtime(const fs::path& path, std::chrono::seconds delta) {
    fs::last_write_time(path, fs::last_write_time(path) + delta);
}

fs::path write_fake_compiler(const fs::path& bin_dir, const fs::path& log,
                             const std::string& version) {
    std::string script = "#!/bin/sh\nLOG='" + log.string() + "'\nVERSION='" + version + "'\n";
    script += R"SH(
if [ "$1" = "--version" ]; then
    echo "Intel(r) Implicit SPMD Program Compiler (Intel(r) ISPC), $VERSION (build test)"
    exit 0
fi
src=""; obj=""; hdr=""; dep=""; targets=""
while [ $# -gt 0 ]; do
    case "$1" in
        -o) obj="$2"; shift 2 ;;
        -h) hdr="$2"; shift 2 ;;
        -MMM) dep="$2"; shift 2 ;;
        --target=*) targets="${1#--target=}"; shift ;;
        -*) shift ;;
        *) src="$1"; shift ;;
    esac
done
echo "$src" >> "$LOG"
if grep -q '^#error' "$src"; then
    grep -n '^#error' "$src" | sed "s|^|$src:|" >&2
    exit 1
fi
grep -n '^#warning' "$src" | sed "s|^|$src:|" >&2
stem=$(basename "$src" | sed 's/\.[^.]*$//')
grep '^//h ' "$src" | sed 's|^//h ||' > "$hdr"
{
    grep '^//c ' "$src" | sed 's|^//c ||'
    echo "int simdbuild_fake_${stem}(void) { return 0; }"
} | cc -x c -c -o "$obj" - || exit 1
case "$targets" in
    *,*)
        base="${obj%.o}"
        for t in $(echo "$targets" | tr ',' ' '); do
            family="${t%%-*}"
            case "$family" in
                avx1) suffix=avx ;;
                *) suffix="$family" ;;
            esac
            echo "int simdbuild_fake_${stem}_${suffix}(void) { return 0; }" \
                | cc -x c -c -o "${base}_${suffix}.o" - || exit 1
        done
        ;;
esac
dir=$(dirname "$src")
{
    echo "$src"
    grep '^#include "' "$src" | sed 's|^#include "\(.*\)".*|\1|' | while read -r inc; do
        echo "$dir/$inc"
    done
} > "$dep"
exit 0
)SH";
    auto path = bin_dir / "ispc";
    write_script(path, script);
    return path;
}

fs::path write_fake_extractor(const fs::path& bin_dir, const fs::path& ast_json,
                              const fs::path& log) {
    std::string script = "#!/bin/sh\necho \"$@\" >> '" + log.string() + "'\ncat '" +
                         ast_json.string() + "'\n";
    auto path = bin_dir / "clang";
    write_script(path, script);
    return path;
}

build::BuildEnv make_env(const fs::path& root) {
    fs::create_directories(root / "bin");
    build::BuildEnv env;
    const char* path = std::getenv("PATH");
    env.path = (root / "bin").string() + ":" + (path ? path : "/usr/bin:/bin");
    env.cwd = root;
    env.out_dir = root / "out";
    env.debug = "false";
    return env;
}

std::string translation_unit_json(const fs::path& header,
                                  const std::vector<std::string>& decls_json) {
    std::string json = R"({"id":"0x1","kind":"TranslationUnitDecl","loc":{},)"
                       R"("range":{"begin":{},"end":{}},"inner":[)";
    json += R"({"id":"0x2","kind":"TypedefDecl","loc":{},"range":{"begin":{},"end":{}},)"
            R"("isImplicit":true,"name":"__int128_t","type":{"qualType":"__int128"}},)";
    json += R"({"id":"0x3","kind":"TypedefDecl","loc":{"offset":100,)"
            R"("file":"/usr/include/x86_64-linux-gnu/bits/types.h","line":40,"col":23,)"
            R"("tokLen":8,"includedFrom":{"file":"/usr/include/stdint.h"}},)"
            R"("range":{"begin":{"offset":80,"col":1,"tokLen":7},)"
            R"("end":{"offset":100,"col":23,"tokLen":8}},)"
            R"("name":"__uint32_t","type":{"qualType":"unsigned int"}})";

    int line = 1;
    for (const auto& decl : decls_json) {
        std::string loc = line == 1 ? R"("loc":{"offset":0,"file":")" + header.string() +
                                          R"(","line":1,"col":1,"tokLen":1},)"
                                    : R"("loc":{"offset":)" + std::to_string(line * 10) +
                                          R"(,"line":)" + std::to_string(line) +
                                          R"(,"col":1,"tokLen":1},)";
        json += ",{" + loc + decl.substr(1);
        ++line;
    }
    json += "]}";
    return json;
}

} // namespace simdbuild::test
