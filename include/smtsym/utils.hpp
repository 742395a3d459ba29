// ============================================================================
// smtsym/utils.hpp - String helpers and SMT-Lib naming rules
// ============================================================================

#ifndef SMTSYM_UTILS_HPP
#define SMTSYM_UTILS_HPP

#include <string>
#include <vector>

namespace smtsym {

// ── String helpers ──────────────────────────────────────────────────────────

/// Trim leading and trailing whitespace from a string.
std::string trim(const std::string& s);

/// ASCII lower-casing.
std::string to_lower(const std::string& s);

/// Join the strings with the given separator.
std::string join(const std::vector<std::string>& parts, const std::string& sep);

// ── SMT-Lib names ───────────────────────────────────────────────────────────

/// Reserved words, sort names and theory symbols of SMT-Lib 2, lower case.
const std::vector<std::string>& smtlib_reserved_names();

/// Case-insensitive membership in smtlib_reserved_names().
bool is_smtlib_reserved(const std::string& name);

/// Whether name can be used for an uninterpreted declaration: either a
/// letter followed by letters, digits and '_', or a |quoted| symbol of at
/// least one character with no '|' or '\' inside.
bool is_valid_identifier(const std::string& name);

}  // namespace smtsym

#endif  // SMTSYM_UTILS_HPP
