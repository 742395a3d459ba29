// ============================================================================
// utils.cpp - String utilities and SMT-Lib naming rules
// ============================================================================

#include "smtsym/utils.hpp"

#include <algorithm>
#include <cctype>

namespace smtsym {

// ── trim ────────────────────────────────────────────────────────────────────

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

// ── to_lower ────────────────────────────────────────────────────────────────

std::string to_lower(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

// ── join ────────────────────────────────────────────────────────────────────

std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i) out += sep;
        out += parts[i];
    }
    return out;
}

// ── smtlib_reserved_names ───────────────────────────────────────────────────

const std::vector<std::string>& smtlib_reserved_names() {
    static const std::vector<std::string> names = {
        // Reserved words
        "!", "_", "as", "binary", "decimal", "exists", "hexadecimal", "forall",
        "let", "numeral", "par", "string",
        // Commands
        "assert", "check-sat", "check-sat-assuming", "declare-const",
        "declare-fun", "declare-sort", "define-fun", "define-fun-rec",
        "define-sort", "echo", "exit", "get-assertions", "get-assignment",
        "get-info", "get-model", "get-option", "get-proof", "get-unsat-assumptions",
        "get-unsat-core", "get-value", "pop", "push", "reset",
        "reset-assertions", "set-info", "set-logic", "set-option",
        // Core theory
        "bool", "true", "false", "not", "=>", "and", "or", "xor", "=",
        "distinct", "ite",
        // Arithmetic and sorts
        "int", "real", "array", "select", "store", "div", "mod", "abs",
        "to_real", "to_int", "is_int",
        // Floating point
        "roundingmode", "float16", "float32", "float64", "float128",
        "rne", "rna", "rtp", "rtn", "rtz", "fp", "nan", "+zero", "-zero",
        "+oo", "-oo"
    };
    return names;
}

bool is_smtlib_reserved(const std::string& name) {
    const auto& names = smtlib_reserved_names();
    return std::find(names.begin(), names.end(), to_lower(name)) != names.end();
}

// ── is_valid_identifier ─────────────────────────────────────────────────────

bool is_valid_identifier(const std::string& name) {
    if (name.empty()) return false;

    const bool enclosed = name.size() > 2 && name.front() == '|' && name.back() == '|'
        && name.find_first_of("|\\", 1) == name.size() - 1;
    if (enclosed) return true;

    if (!std::isalpha(static_cast<unsigned char>(name.front()))) return false;
    return std::all_of(name.begin() + 1, name.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '_';
    });
}

}  // namespace smtsym
