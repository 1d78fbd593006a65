#include "simdbuild/bindings/clang_ast_reader.hpp"

#include "simdbuild/log/log.hpp"

#include <charconv>
#include <set>

namespace simdbuild::bindings {

namespace {

// ============================================================================
// Location Tracking
// ============================================================================

/// Replays clang's "file is printed only on change" location encoding.
class LocationTracker {
public:
    [[nodiscard]] const std::string& current() const {
        return current_;
    }

    void bare(const json::JsonValue* loc) {
        if (!loc || !loc->is_object()) {
            return;
        }
        auto file = loc->get_string("file");
        if (!file.empty()) {
            current_ = std::string(file);
        }
    }

    void location(const json::JsonValue* loc) {
        if (!loc || !loc->is_object()) {
            return;
        }
        const auto* spelling = loc->get("spellingLoc");
        const auto* expansion = loc->get("expansionLoc");
        if (spelling || expansion) {
            bare(spelling);
            bare(expansion);
        } else {
            bare(loc);
        }
    }

    void range(const json::JsonValue* range) {
        if (!range || !range->is_object()) {
            return;
        }
        location(range->get("begin"));
        location(range->get("end"));
    }

    /// Walks a subtree after its own `loc` was consumed.
    void rest_of(const json::JsonValue& node) {
        range(node.get("range"));
        for (const auto& child : node.get_array("inner")) {
            location(child.get("loc"));
            rest_of(child);
        }
    }

private:
    std::string current_;
};

// ============================================================================
// Header Matching
// ============================================================================

class HeaderSet {
public:
    explicit HeaderSet(const std::vector<fs::path>& headers) {
        for (const auto& header : headers) {
            add(header);
        }
    }

    [[nodiscard]] bool contains(const std::string& file) const {
        if (file.empty()) {
            return false;
        }
        fs::path path(file);
        if (names_.count(path.lexically_normal().string())) {
            return true;
        }
        std::error_code ec;
        auto canonical = fs::weakly_canonical(path, ec);
        return !ec && names_.count(canonical.string()) > 0;
    }

private:
    std::set<std::string> names_;

    void add(const fs::path& header) {
        names_.insert(header.lexically_normal().string());
        std::error_code ec;
        auto canonical = fs::weakly_canonical(header, ec);
        if (!ec) {
            names_.insert(canonical.string());
        }
    }
};

// ============================================================================
// Node Readers
// ============================================================================

std::string qual_type(const json::JsonValue& node) {
    const auto* type = node.get("type");
    if (!type) {
        return {};
    }
    return std::string(type->get_string("qualType"));
}

/// Return type of a function type spelling "R (A, B)".
bool split_return_type(const std::string& fn_type, std::string& return_type) {
    size_t open = fn_type.find('(');
    if (open == std::string::npos || fn_type.back() != ')') {
        return false;
    }
    int depth = 0;
    for (size_t i = open; i < fn_type.size(); ++i) {
        if (fn_type[i] == '(') {
            ++depth;
        } else if (fn_type[i] == ')') {
            --depth;
            if (depth == 0 && i + 1 != fn_type.size()) {
                return false;
            }
        }
    }
    return_type = fn_type.substr(0, open);
    while (!return_type.empty() && return_type.back() == ' ') {
        return_type.pop_back();
    }
    return !return_type.empty();
}

/// Finds the constant value clang folded for an enumerator initializer.
const json::JsonValue* folded_value(const json::JsonValue& node) {
    for (const auto& child : node.get_array("inner")) {
        if (child.get_string("kind") == "ConstantExpr") {
            const auto* value = child.get("value");
            if (value && value->is_string()) {
                return value;
            }
        }
        if (const auto* nested = folded_value(child)) {
            return nested;
        }
    }
    return nullptr;
}

bool parse_int64(std::string_view text, int64_t& out) {
    if (!text.empty() && text.front() != '-') {
        // Unsigned 64-bit enumerators keep their bit pattern.
        uint64_t unsigned_value = 0;
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), unsigned_value);
        if (ec == std::errc() && ptr == text.data() + text.size()) {
            out = static_cast<int64_t>(unsigned_value);
            return true;
        }
        return false;
    }
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
    return ec == std::errc() && ptr == text.data() + text.size();
}

class DeclReader {
public:
    explicit DeclReader(DeclarationSet& out) : out_(out) {}

    void read(const json::JsonValue& node) {
        auto kind = node.get_string("kind");
        std::string name(node.get_string("name"));

        if (kind == "FunctionDecl") {
            read_function(node, name);
        } else if (kind == "RecordDecl") {
            read_record(node, name);
        } else if (kind == "EnumDecl") {
            read_enum(node, name);
        } else if (kind == "TypedefDecl") {
            read_typedef(node, name);
        } else {
            warn("skipping " + std::string(kind) + (name.empty() ? "" : " '" + name + "'"));
            pending_unnamed_ = false;
        }
    }

private:
    DeclarationSet& out_;
    std::set<std::string> record_names_;
    bool pending_unnamed_ = false; ///< Last decl is an unnamed record or enum

    void warn(std::string message) {
        SIMDBUILD_LOG_DEBUG("bindings", message);
        out_.warnings.push_back(std::move(message));
    }

    void read_function(const json::JsonValue& node, const std::string& name) {
        pending_unnamed_ = false;
        if (node.get_bool("variadic")) {
            warn("skipping variadic function '" + name + "'");
            return;
        }
        CFunction fn;
        fn.name = name;
        if (!split_return_type(qual_type(node), fn.return_type)) {
            warn("skipping function '" + name + "' with unsupported type '" + qual_type(node) +
                 "'");
            return;
        }
        for (const auto& child : node.get_array("inner")) {
            if (child.get_string("kind") == "ParmVarDecl") {
                fn.params.push_back(CParam{std::string(child.get_string("name")), qual_type(child)});
            }
        }
        out_.decls.emplace_back(std::move(fn));
    }

    void read_record(const json::JsonValue& node, const std::string& name) {
        CRecord record;
        record.name = name;
        record.is_union = node.get_string("tagUsed") == "union";
        record.complete = node.get_bool("completeDefinition");
        for (const auto& child : node.get_array("inner")) {
            if (child.get_string("kind") != "FieldDecl") {
                continue;
            }
            CField field;
            field.name = std::string(child.get_string("name"));
            field.type = qual_type(child);
            field.bitfield = child.get_bool("isBitfield");
            record.fields.push_back(std::move(field));
        }
        pending_unnamed_ = name.empty();
        if (!name.empty()) {
            record_names_.insert(name);
        }
        out_.decls.emplace_back(std::move(record));
    }

    void read_enum(const json::JsonValue& node, const std::string& name) {
        CEnum e;
        e.name = name;
        if (const auto* fixed = node.get("fixedUnderlyingType")) {
            e.fixed_underlying = std::string(fixed->get_string("qualType"));
        }
        int64_t next = 0;
        for (const auto& child : node.get_array("inner")) {
            if (child.get_string("kind") != "EnumConstantDecl") {
                continue;
            }
            CEnumerator value;
            value.name = std::string(child.get_string("name"));
            value.value = next;
            if (const auto* folded = folded_value(child)) {
                if (!parse_int64(folded->as_string(), value.value)) {
                    warn("enumerator '" + value.name + "' has unreadable value '" +
                         folded->as_string() + "'");
                }
            }
            next = static_cast<int64_t>(static_cast<uint64_t>(value.value) + 1);
            e.values.push_back(std::move(value));
        }
        pending_unnamed_ = name.empty();
        out_.decls.emplace_back(std::move(e));
    }

    void read_typedef(const json::JsonValue& node, const std::string& name) {
        auto type = qual_type(node);
        bool names_unnamed = type.find("(unnamed") != std::string::npos ||
                             type.find("(anonymous") != std::string::npos;

        if (names_unnamed && pending_unnamed_ && !out_.decls.empty()) {
            // typedef struct { ... } Name;
            pending_unnamed_ = false;
            auto& last = out_.decls.back();
            if (auto* record = std::get_if<CRecord>(&last)) {
                record->name = name;
                record_names_.insert(name);
            } else if (auto* e = std::get_if<CEnum>(&last)) {
                e->name = name;
            }
            return;
        }
        pending_unnamed_ = false;
        if (record_names_.count(name)) {
            // typedef struct Name Name;
            return;
        }
        out_.decls.emplace_back(CTypedef{name, type});
    }
};

} // namespace

auto read_declarations(const json::JsonValue& tu, const std::vector<fs::path>& headers)
    -> Result<DeclarationSet, std::string> {
    if (!tu.is_object() || tu.get_string("kind") != "TranslationUnitDecl") {
        return std::string("AST root is not a TranslationUnitDecl");
    }

    HeaderSet wanted(headers);
    LocationTracker tracker;
    DeclarationSet result;
    DeclReader reader(result);
    size_t foreign = 0;

    for (const auto& node : tu.get_array("inner")) {
        tracker.location(node.get("loc"));
        std::string file = tracker.current();
        tracker.rest_of(node);

        if (node.get_bool("isImplicit")) {
            continue;
        }
        if (!wanted.contains(file)) {
            ++foreign;
            continue;
        }
        reader.read(node);
    }

    // Anonymous declarations that no typedef named cannot be referenced.
    std::erase_if(result.decls, [&](const CDecl& decl) {
        if (!decl_name(decl).empty()) {
            return false;
        }
        result.warnings.push_back("skipping anonymous declaration");
        return true;
    });

    SIMDBUILD_LOG_DEBUG("bindings", "read " << result.decls.size() << " declarations, ignored "
                                            << foreign << " from other files");
    return result;
}

} // namespace simdbuild::bindings
