//! # C Declaration Model
//!
//! The subset of C the compiler writes into its generated headers:
//! functions, structs, unions, enums and typedefs. Types are kept as the
//! extractor spelled them and parsed on demand by `parse_c_type()`.

#ifndef SIMDBUILD_BINDINGS_C_DECL_HPP
#define SIMDBUILD_BINDINGS_C_DECL_HPP

#include "simdbuild/common.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace simdbuild::bindings {

// ============================================================================
// Declarations
// ============================================================================

struct CParam {
    std::string name; ///< May be empty for unnamed parameters
    std::string type;
};

struct CFunction {
    std::string name;
    std::string return_type;
    std::vector<CParam> params;
    bool variadic = false;
};

struct CField {
    std::string name;
    std::string type;
    bool bitfield = false;
};

struct CRecord {
    std::string name;
    bool is_union = false;
    bool complete = false; ///< False for a forward declaration
    std::vector<CField> fields;
};

struct CEnumerator {
    std::string name;
    int64_t value = 0;
};

struct CEnum {
    std::string name;
    std::string fixed_underlying; ///< Empty unless the enum fixes its type
    std::vector<CEnumerator> values;
};

struct CTypedef {
    std::string name;
    std::string type;
};

using CDecl = std::variant<CFunction, CRecord, CEnum, CTypedef>;

/// Name of any declaration.
[[nodiscard]] auto decl_name(const CDecl& decl) -> const std::string&;

/// Declarations read from the compiler headers, in header order.
struct DeclarationSet {
    std::vector<CDecl> decls;
    std::vector<std::string> warnings; ///< Constructs that were skipped while reading
};

// ============================================================================
// Type Spellings
// ============================================================================

/// A parsed C type spelling.
struct CType {
    enum class Kind {
        Void,
        Builtin,     ///< `name` holds the normalized spelling, e.g. "unsigned int"
        Record,      ///< struct or union tag in `name`
        Enum,        ///< enum tag in `name`
        Named,       ///< typedef name in `name`
        Pointer,     ///< `element` is the pointee
        Array,       ///< `element` repeated `array_len` times
        Unsupported, ///< `name` holds the reason
    };

    Kind kind = Kind::Unsupported;
    std::string name;
    bool is_const = false;
    uint64_t array_len = 0;
    Rc<CType> element;
};

/// Parses a spelling such as "const float *", "struct Foo[4]", "uint64_t".
///
/// Function types, function pointers, anonymous records and incomplete
/// arrays come back as `Kind::Unsupported`.
[[nodiscard]] auto parse_c_type(std::string_view spelling) -> CType;

} // namespace simdbuild::bindings

#endif // SIMDBUILD_BINDINGS_C_DECL_HPP
