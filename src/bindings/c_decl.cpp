#include "simdbuild/bindings/c_decl.hpp"

#include <charconv>

namespace simdbuild::bindings {

auto decl_name(const CDecl& decl) -> const std::string& {
    return std::visit([](const auto& d) -> const std::string& { return d.name; }, decl);
}

// ============================================================================
// Type Spelling Parser
// ============================================================================

namespace {

std::string_view trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) {
        s.remove_prefix(1);
    }
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) {
        s.remove_suffix(1);
    }
    return s;
}

std::vector<std::string_view> split_words(std::string_view s) {
    std::vector<std::string_view> words;
    size_t pos = 0;
    while (pos < s.size()) {
        while (pos < s.size() && s[pos] == ' ') {
            ++pos;
        }
        size_t end = pos;
        while (end < s.size() && s[end] != ' ') {
            ++end;
        }
        if (end > pos) {
            words.push_back(s.substr(pos, end - pos));
        }
        pos = end;
    }
    return words;
}

bool is_qualifier(std::string_view word) {
    return word == "const" || word == "volatile" || word == "restrict" || word == "__restrict" ||
           word == "__restrict__";
}

CType unsupported(std::string reason) {
    CType t;
    t.kind = CType::Kind::Unsupported;
    t.name = std::move(reason);
    return t;
}

/// Strips trailing pointer qualifiers ("* const", "*restrict").
std::string_view strip_trailing_qualifiers(std::string_view s) {
    while (true) {
        s = trim(s);
        bool stripped = false;
        for (std::string_view q : {"const", "volatile", "restrict", "__restrict", "__restrict__"}) {
            if (s.size() > q.size() && s.ends_with(q)) {
                char before = s[s.size() - q.size() - 1];
                if (before == ' ' || before == '*') {
                    s.remove_suffix(q.size());
                    stripped = true;
                    break;
                }
            }
        }
        if (!stripped) {
            return s;
        }
    }
}

CType parse_base(std::string_view s) {
    CType t;
    std::vector<std::string_view> words;
    for (auto word : split_words(s)) {
        if (word == "const") {
            t.is_const = true;
        } else if (!is_qualifier(word)) {
            words.push_back(word);
        }
    }
    if (words.empty()) {
        return unsupported("empty type");
    }

    if (words[0] == "struct" || words[0] == "union" || words[0] == "enum") {
        if (words.size() != 2) {
            return unsupported("anonymous or malformed tag type '" + std::string(s) + "'");
        }
        t.kind = words[0] == "enum" ? CType::Kind::Enum : CType::Kind::Record;
        t.name = std::string(words[1]);
        return t;
    }

    std::string joined;
    for (size_t i = 0; i < words.size(); ++i) {
        if (i > 0) {
            joined += ' ';
        }
        joined += words[i];
    }
    if (joined == "void") {
        t.kind = CType::Kind::Void;
        t.name = joined;
        return t;
    }
    if (words.size() == 1) {
        // Builtin single words ("int", "float") and typedef names are told
        // apart by the type mapper.
        t.kind = CType::Kind::Named;
        t.name = joined;
        return t;
    }
    t.kind = CType::Kind::Builtin;
    t.name = joined;
    return t;
}

} // namespace

auto parse_c_type(std::string_view spelling) -> CType {
    auto s = trim(spelling);
    if (s.empty()) {
        return unsupported("empty type");
    }
    if (s.find('(') != std::string_view::npos) {
        return unsupported("'" + std::string(s) + "' (function or anonymous type)");
    }

    // Arrays: "T[2][3]" is an array of 2 arrays of 3 T.
    if (s.back() == ']') {
        size_t first = s.find('[');
        std::vector<uint64_t> dims;
        size_t pos = first;
        while (pos < s.size() && s[pos] == '[') {
            size_t close = s.find(']', pos);
            if (close == std::string_view::npos) {
                return unsupported("malformed array type '" + std::string(s) + "'");
            }
            auto digits = trim(s.substr(pos + 1, close - pos - 1));
            uint64_t len = 0;
            auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), len);
            if (digits.empty() || ec != std::errc() || ptr != digits.data() + digits.size()) {
                return unsupported("array without constant length '" + std::string(s) + "'");
            }
            dims.push_back(len);
            pos = close + 1;
            while (pos < s.size() && s[pos] == ' ') {
                ++pos;
            }
        }
        if (pos != s.size()) {
            return unsupported("malformed array type '" + std::string(s) + "'");
        }
        auto element = make_rc<CType>(parse_c_type(s.substr(0, first)));
        for (auto it = dims.rbegin(); it != dims.rend(); ++it) {
            CType array;
            array.kind = CType::Kind::Array;
            array.array_len = *it;
            array.element = element;
            element = make_rc<CType>(std::move(array));
        }
        return *element;
    }

    auto stripped = strip_trailing_qualifiers(s);
    if (!stripped.empty() && stripped.back() == '*') {
        CType pointer;
        pointer.kind = CType::Kind::Pointer;
        stripped.remove_suffix(1);
        pointer.element = make_rc<CType>(parse_c_type(stripped));
        return pointer;
    }
    return parse_base(stripped);
}

} // namespace simdbuild::bindings
