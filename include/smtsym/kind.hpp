// ============================================================================
// smtsym/kind.hpp - Sort descriptors for symbolic and concrete values
// ============================================================================
//
// A Kind describes the sort of a node: booleans, signed/unsigned bit-vectors
// of a given width, unbounded integers, reals, IEEE single/double floats and
// user-defined (uninterpreted or enumerated) sorts.
//
// Kinds are plain values with a total order so that they can be stored in
// ordered sets (the "used kinds" of a run) and used as map keys.
//
// ============================================================================

#ifndef SMTSYM_KIND_HPP
#define SMTSYM_KIND_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace smtsym {

// ── KindTag ─────────────────────────────────────────────────────────────────

enum class KindTag : std::uint8_t {
    Bool,
    Bounded,     // bit-vector, signed or unsigned, of a fixed width
    Unbounded,   // mathematical integer
    Real,        // algebraic real
    UserSort,    // uninterpreted or enumerated sort
    Float,
    Double
};

// ── Kind ────────────────────────────────────────────────────────────────────

struct Kind {
    KindTag       tag = KindTag::Bool;
    bool          is_signed = false;     // Bounded only
    std::int32_t  width = 0;             // Bounded only
    std::string   sort_name;             // UserSort only

    // For enumerated user sorts, the constructor names; nullopt for a
    // completely uninterpreted sort.
    std::optional<std::vector<std::string>> constructors;

    static Kind boolean() { return Kind{}; }
    static Kind bounded(bool sgn, std::int32_t w) {
        Kind k;
        k.tag = KindTag::Bounded;
        k.is_signed = sgn;
        k.width = w;
        return k;
    }
    static Kind unbounded() { Kind k; k.tag = KindTag::Unbounded; return k; }
    static Kind real()      { Kind k; k.tag = KindTag::Real;      return k; }
    static Kind fp_float()  { Kind k; k.tag = KindTag::Float;     return k; }
    static Kind fp_double() { Kind k; k.tag = KindTag::Double;    return k; }
    static Kind user_sort(const std::string& name,
                          std::optional<std::vector<std::string>> ctors = std::nullopt) {
        Kind k;
        k.tag = KindTag::UserSort;
        k.sort_name = name;
        k.constructors = std::move(ctors);
        return k;
    }

    bool is_boolean() const noexcept   { return tag == KindTag::Bool; }
    bool is_bounded() const noexcept   { return tag == KindTag::Bounded; }
    bool is_user_sort() const noexcept { return tag == KindTag::UserSort; }
    bool is_floating() const noexcept  {
        return tag == KindTag::Float || tag == KindTag::Double;
    }

    /// Whether values of this kind carry a sign.
    bool has_sign() const noexcept;

    /// Bit size of the kind.  Bool is 1, Float 32, Double 64.  Throws
    /// std::runtime_error for kinds without a fixed size.
    std::int32_t int_size() const;

    bool operator==(const Kind& o) const noexcept;
    bool operator!=(const Kind& o) const noexcept { return !(*this == o); }
    bool operator<(const Kind& o) const noexcept;

    /// SBool, SWord8, SInt32, SInteger, SReal, SFloat, SDouble or the sort name.
    std::string to_string() const;
};

}  // namespace smtsym

#endif  // SMTSYM_KIND_HPP
