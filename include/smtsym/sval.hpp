// ============================================================================
// smtsym/sval.hpp - Symbolic values
// ============================================================================
//
// An SVal is either a known constant (CW) or a deferred builder that yields
// a node when run against a construction context.  Deferred builders are
// Cached so that observing the same SVal twice in one context yields the
// same node.
//
// SVals are cheap to copy; copies share the builder and its cache token.
//
// ============================================================================

#ifndef SMTSYM_SVAL_HPP
#define SMTSYM_SVAL_HPP

#include "smtsym/cache.hpp"
#include "smtsym/concrete.hpp"
#include "smtsym/node.hpp"

#include <optional>
#include <string>
#include <variant>

namespace smtsym {

class State;

// ── SVal ────────────────────────────────────────────────────────────────────

struct SVal {
    Kind                          kind;
    std::variant<CW, Cached<SW>>  val;

    static SVal constant(const CW& cw) { return SVal{cw.kind, cw}; }
    static SVal symbolic(const Kind& k, Cached<SW> c) { return SVal{k, std::move(c)}; }

    bool is_concrete() const noexcept { return std::holds_alternative<CW>(val); }

    /// The constant payload, if any.
    std::optional<CW> as_concrete() const;

    /// "<cw> :: <kind>" for constants, "<symbolic> :: <kind>" otherwise.
    std::string to_string() const;
};

inline SVal sv_true()  { return SVal::constant(true_cw()); }
inline SVal sv_false() { return SVal::constant(false_cw()); }
inline SVal sv_bool(bool b) { return SVal::constant(bool_cw(b)); }

/// Intern a constant or uncache a symbolic value into a node of st.
SW sv_to_sw(State& st, const SVal& v);

/// Uncache against st's node cache.
SW uncache(const Cached<SW>& c, State& st);

/// An SVal that always refers to an existing node.
SVal sval_of_sw(const SW& sw);

// ── Variables ───────────────────────────────────────────────────────────────

/// Create a symbolic variable.  The quantifier defaults by mode: existential
/// under satisfiability search, universal otherwise.  In Concrete mode a
/// random value is drawn instead and recorded in the trace info.
SVal sv_mk_sym_var(State& st, std::optional<Quantifier> q, const Kind& k,
                   const std::optional<std::string>& name = std::nullopt);

/// Create a variable of a user-defined sort.  Only legal in Proof and
/// Interactive modes.
SVal mk_sval_user_sort(State& st, const Kind& k, std::optional<Quantifier> q,
                       const std::optional<std::string>& name = std::nullopt);

/// Register sw as the input `name`.  Throws ValidationError if the name is
/// already taken.
SVal introduce_user_name(State& st, const std::string& name, const Kind& k,
                         Quantifier q, const SW& sw);

/// Append v to the outputs of st.
void output_sval(State& st, const SVal& v);

}  // namespace smtsym

#endif  // SMTSYM_SVAL_HPP
