#include "simdbuild/bindings/rust_emitter.hpp"

#include "simdbuild/bindings/type_mapper.hpp"
#include "simdbuild/log/log.hpp"

#include <limits>
#include <map>
#include <set>
#include <sstream>

namespace simdbuild::bindings {

bool is_runtime_entry_point(const std::string& name) {
    return name == "ISPCLaunch" || name == "ISPCSync" || name == "ISPCAlloc" ||
           name == "ISPCInstrument";
}

namespace {

constexpr const char* INDENT = "    ";

struct EnumRepr {
    std::string rust_type;
    bool is_unsigned = true;
};

EnumRepr enum_repr(const CEnum& e, std::vector<std::string>& warnings) {
    if (!e.fixed_underlying.empty()) {
        auto rust = rust_integer_for(e.fixed_underlying);
        if (!rust.empty()) {
            return EnumRepr{rust, rust.front() == 'u' || rust.find("c_u") != std::string::npos};
        }
        warnings.push_back("enum '" + e.name + "' has unsupported underlying type '" +
                           e.fixed_underlying + "', inferring it from the values");
    }
    bool negative = false;
    bool wide = false;
    for (const auto& v : e.values) {
        if (v.value < 0) {
            negative = true;
            if (v.value < std::numeric_limits<int32_t>::min()) {
                wide = true;
            }
        } else if (v.value > std::numeric_limits<int32_t>::max()) {
            if (v.value > static_cast<int64_t>(std::numeric_limits<uint32_t>::max())) {
                wide = true;
            }
        }
    }
    if (negative) {
        return EnumRepr{wide ? "i64" : "i32", false};
    }
    return EnumRepr{wide ? "u64" : "u32", true};
}

std::string enum_literal(int64_t value, const EnumRepr& repr) {
    if (!repr.is_unsigned) {
        return std::to_string(value);
    }
    auto bits = static_cast<uint64_t>(value);
    if (repr.rust_type == "u8") {
        bits &= 0xFFu;
    } else if (repr.rust_type == "u16") {
        bits &= 0xFFFFu;
    } else if (repr.rust_type == "u32") {
        bits &= 0xFFFFFFFFu;
    }
    return std::to_string(bits);
}

/// The type a field stores by value: arrays are looked through, pointers
/// are not.
std::string by_value_name(const CType& type) {
    const CType* t = &type;
    while (t->kind == CType::Kind::Array && t->element) {
        t = t->element.get();
    }
    if (t->kind == CType::Kind::Record || t->kind == CType::Kind::Named) {
        return t->name;
    }
    return {};
}

class Emitter {
public:
    Emitter(const std::string& module_name, const DeclarationSet& decls)
        : module_name_(module_name), decls_(decls) {}

    RustModule run() {
        out_.warnings = decls_.warnings;
        collect();
        prune();
        find_debug_blockers();
        write();
        return std::move(out_);
    }

private:
    const std::string& module_name_;
    const DeclarationSet& decls_;
    RustModule out_;
    TypeMapper mapper_;

    std::map<std::string, const CRecord*> records_; ///< Complete definition when there is one
    std::map<std::string, const CTypedef*> typedefs_;
    std::set<std::string> dropped_;
    std::set<std::string> no_debug_;

    void warn(std::string message) {
        out_.warnings.push_back(std::move(message));
    }

    void collect() {
        for (const auto& decl : decls_.decls) {
            if (const auto* record = std::get_if<CRecord>(&decl)) {
                auto& slot = records_[record->name];
                if (!slot || (!slot->complete && record->complete)) {
                    slot = record;
                }
                mapper_.add_record(record->name);
            } else if (const auto* e = std::get_if<CEnum>(&decl)) {
                mapper_.add_enum(e->name);
            } else if (const auto* td = std::get_if<CTypedef>(&decl)) {
                typedefs_.emplace(td->name, td);
                mapper_.add_typedef(td->name);
            }
        }
    }

    /// Why a complete record cannot be emitted, "" if it can.
    std::string record_problem(const CRecord& record) const {
        for (const auto& field : record.fields) {
            if (field.name.empty()) {
                return "anonymous member";
            }
            if (field.bitfield) {
                return "bitfield '" + field.name + "'";
            }
            auto mapped = mapper_.map(field.type);
            if (is_err(mapped)) {
                return "field '" + field.name + "': " + unwrap_err(mapped).reason;
            }
        }
        return {};
    }

    void drop(const std::string& name, const std::string& what, const std::string& reason) {
        warn("skipping " + what + " '" + name + "': " + reason);
        mapper_.remove(name);
        dropped_.insert(name);
    }

    /// Removes records and typedefs until every remaining one maps.
    void prune() {
        bool changed = true;
        while (changed) {
            changed = false;
            for (const auto& [name, record] : records_) {
                if (dropped_.count(name) || !record->complete) {
                    continue;
                }
                auto problem = record_problem(*record);
                if (!problem.empty()) {
                    drop(name, record->is_union ? "union" : "struct", problem);
                    changed = true;
                }
            }
            for (const auto& [name, td] : typedefs_) {
                if (dropped_.count(name)) {
                    continue;
                }
                auto mapped = mapper_.map(td->type);
                if (is_err(mapped)) {
                    drop(name, "typedef", unwrap_err(mapped).reason);
                    changed = true;
                }
            }
        }
    }

    /// Records that hold a union by value cannot derive Debug.
    void find_debug_blockers() {
        for (const auto& [name, record] : records_) {
            if (record->is_union) {
                no_debug_.insert(name);
            }
        }
        bool changed = true;
        while (changed) {
            changed = false;
            for (const auto& [name, td] : typedefs_) {
                auto target = by_value_name(parse_c_type(td->type));
                if (!target.empty() && no_debug_.count(target) && no_debug_.insert(name).second) {
                    changed = true;
                }
            }
            for (const auto& [name, record] : records_) {
                if (no_debug_.count(name)) {
                    continue;
                }
                for (const auto& field : record->fields) {
                    auto target = by_value_name(parse_c_type(field.type));
                    if (!target.empty() && no_debug_.count(target)) {
                        no_debug_.insert(name);
                        changed = true;
                        break;
                    }
                }
            }
        }
    }

    // ------------------------------------------------------------------------
    // Output
    // ------------------------------------------------------------------------

    void write() {
        std::ostringstream body;
        std::ostringstream functions;
        std::set<std::string> emitted_types;
        std::set<std::string> emitted_functions;

        for (const auto& decl : decls_.decls) {
            if (const auto* record = std::get_if<CRecord>(&decl)) {
                if (dropped_.count(record->name) || records_[record->name] != record ||
                    !emitted_types.insert(record->name).second) {
                    continue;
                }
                write_record(body, *record);
            } else if (const auto* e = std::get_if<CEnum>(&decl)) {
                if (!emitted_types.insert(e->name).second) {
                    continue;
                }
                write_enum(body, *e);
            } else if (const auto* td = std::get_if<CTypedef>(&decl)) {
                if (dropped_.count(td->name) || !emitted_types.insert(td->name).second) {
                    continue;
                }
                body << INDENT << "pub type " << rust_ident(td->name) << " = "
                     << unwrap(mapper_.map(td->type)) << ";\n";
                ++out_.declaration_count;
            } else if (const auto* fn = std::get_if<CFunction>(&decl)) {
                if (is_runtime_entry_point(fn->name)) {
                    warn("skipping task runtime entry point '" + fn->name + "'");
                    continue;
                }
                if (!emitted_functions.insert(fn->name).second) {
                    continue;
                }
                write_function(functions, *fn);
            }
        }

        std::ostringstream text;
        text << "/* automatically generated by simdbuild " << VERSION << " */\n\n";
        text << "#[allow(non_camel_case_types, dead_code, non_upper_case_globals, non_snake_case, "
                "improper_ctypes)]\n";
        text << "pub mod " << rust_ident(module_name_) << " {\n";
        text << body.str();
        auto fn_text = functions.str();
        if (!fn_text.empty()) {
            text << INDENT << "unsafe extern \"C\" {\n" << fn_text << INDENT << "}\n";
        }
        text << "}\n";
        out_.text = text.str();

        SIMDBUILD_LOG_DEBUG("bindings", "emitted " << out_.declaration_count << " declarations, "
                                                   << out_.warnings.size() << " warnings");
    }

    void write_record(std::ostringstream& os, const CRecord& record) {
        auto ident = rust_ident(record.name);
        os << INDENT << "#[repr(C)]\n";
        if (!record.complete) {
            os << INDENT << "#[derive(Debug, Copy, Clone)]\n";
            os << INDENT << "pub struct " << ident << " {\n";
            os << INDENT << INDENT << "_unused: [u8; 0],\n";
            os << INDENT << "}\n";
            ++out_.declaration_count;
            return;
        }
        os << INDENT << (no_debug_.count(record.name) ? "#[derive(Copy, Clone)]\n"
                                                      : "#[derive(Debug, Copy, Clone)]\n");
        os << INDENT << "pub " << (record.is_union ? "union " : "struct ") << ident << " {\n";
        for (const auto& field : record.fields) {
            os << INDENT << INDENT << "pub " << rust_ident(field.name) << ": "
               << unwrap(mapper_.map(field.type)) << ",\n";
        }
        os << INDENT << "}\n";
        ++out_.declaration_count;
    }

    void write_enum(std::ostringstream& os, const CEnum& e) {
        auto repr = enum_repr(e, out_.warnings);
        auto ident = rust_ident(e.name);
        os << INDENT << "#[repr(transparent)]\n";
        os << INDENT << "#[derive(Debug, Copy, Clone, PartialEq, Eq, Hash)]\n";
        os << INDENT << "pub struct " << ident << "(pub " << repr.rust_type << ");\n";
        if (!e.values.empty()) {
            os << INDENT << "impl " << ident << " {\n";
            for (const auto& v : e.values) {
                os << INDENT << INDENT << "pub const " << rust_ident(v.name) << ": " << ident
                   << " = " << ident << "(" << enum_literal(v.value, repr) << ");\n";
            }
            os << INDENT << "}\n";
        }
        ++out_.declaration_count;
    }

    void write_function(std::ostringstream& os, const CFunction& fn) {
        std::vector<std::string> params;
        for (size_t i = 0; i < fn.params.size(); ++i) {
            const auto& param = fn.params[i];
            auto mapped = mapper_.map_param(param.type);
            if (is_err(mapped)) {
                warn("skipping function '" + fn.name + "': parameter " + std::to_string(i) + ": " +
                     unwrap_err(mapped).reason);
                return;
            }
            auto name = param.name.empty() ? "arg" + std::to_string(i) : rust_ident(param.name);
            params.push_back(name + ": " + unwrap(mapped));
        }
        auto ret = mapper_.map_return(fn.return_type);
        if (is_err(ret)) {
            warn("skipping function '" + fn.name + "': return type: " + unwrap_err(ret).reason);
            return;
        }

        os << INDENT << INDENT << "pub unsafe fn " << rust_ident(fn.name) << "(";
        for (size_t i = 0; i < params.size(); ++i) {
            os << (i > 0 ? ", " : "") << params[i];
        }
        os << ")";
        if (!unwrap(ret).empty()) {
            os << " -> " << unwrap(ret);
        }
        os << ";\n";
        out_.function_names.push_back(fn.name);
        ++out_.declaration_count;
    }
};

} // namespace

auto emit_rust_module(const std::string& module_name, const DeclarationSet& decls) -> RustModule {
    return Emitter(module_name, decls).run();
}

} // namespace simdbuild::bindings
