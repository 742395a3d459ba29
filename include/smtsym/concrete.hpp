// ============================================================================
// smtsym/concrete.hpp - Concrete values (CW)
// ============================================================================
//
// A CW pairs a Kind with a concrete payload.  The engine never interprets
// these values arithmetically; it only needs:
//
//   - a total equality and ordering (for hash-consing of constants),
//   - the kind of a value,
//   - a negative-zero test, since +0.0 and -0.0 compare equal but must be
//     kept apart in the constant table,
//   - random sampling of a kind, for concrete (quick-check style) runs.
//
// Ordering of floating payloads is total: NaN equals NaN and sorts above
// every other value; +0.0 and -0.0 are equal.
//
// ============================================================================

#ifndef SMTSYM_CONCRETE_HPP
#define SMTSYM_CONCRETE_HPP

#include "smtsym/kind.hpp"

#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <variant>

namespace smtsym {

// ── AlgRealText ─────────────────────────────────────────────────────────────
// An algebraic real kept in its textual (exact rational) form, e.g. "3/4".

struct AlgRealText {
    std::string text;

    bool operator==(const AlgRealText& o) const noexcept { return text == o.text; }
    bool operator<(const AlgRealText& o) const noexcept { return text < o.text; }
};

// ── UserSortValue ───────────────────────────────────────────────────────────
// An element of a user sort.  index is the constructor position for
// enumerated sorts.

struct UserSortValue {
    std::optional<std::int32_t> index;
    std::string                 name;

    bool operator==(const UserSortValue& o) const noexcept {
        return index == o.index && name == o.name;
    }
    bool operator<(const UserSortValue& o) const noexcept {
        if (index != o.index) return index < o.index;
        return name < o.name;
    }
};

// Integral payloads (including booleans as 0/1) are 64-bit two's complement.
using CWVal = std::variant<std::int64_t, float, double, AlgRealText, UserSortValue>;

// ── CW ──────────────────────────────────────────────────────────────────────

struct CW {
    Kind  kind;
    CWVal val;

    bool is_negative_zero() const noexcept;

    bool operator==(const CW& o) const noexcept;
    bool operator!=(const CW& o) const noexcept { return !(*this == o); }
    bool operator<(const CW& o) const noexcept;

    std::string to_string() const;
};

inline const Kind& kind_of(const CW& cw) noexcept { return cw.kind; }

CW false_cw();
CW true_cw();
CW bool_cw(bool b);
CW integral_cw(const Kind& k, std::int64_t v);
CW float_cw(float f);
CW double_cw(double d);
CW real_cw(const std::string& rational_text);

/// Interpret a boolean CW.  Throws std::runtime_error for non-boolean values.
bool cw_to_bool(const CW& cw);

/// Draw a random value of the given kind.  User sorts cannot be sampled and
/// raise ModeViolation.
CW random_cw(const Kind& k, std::mt19937_64& rng);

}  // namespace smtsym

#endif  // SMTSYM_CONCRETE_HPP
