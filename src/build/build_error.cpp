#include "simdbuild/build/build_error.hpp"

namespace simdbuild::build {

auto error_kind_name(ErrorKind kind) -> std::string_view {
    switch (kind) {
    case ErrorKind::Configuration:
        return "configuration error";
    case ErrorKind::ToolNotFound:
        return "tool not found";
    case ErrorKind::CompilationFailure:
        return "compilation failed";
    case ErrorKind::LinkFailure:
        return "link failed";
    case ErrorKind::BindingGeneration:
        return "binding generation failed";
    case ErrorKind::ArtifactNotFound:
        return "artifact not found";
    case ErrorKind::Io:
        return "i/o error";
    }
    return "error";
}

auto BuildError::to_string() const -> std::string {
    std::string out(error_kind_name(kind));
    out += ": ";
    out += message;
    if (!detail.empty()) {
        out += '\n';
        out += detail;
    }
    return out;
}

} // namespace simdbuild::build
