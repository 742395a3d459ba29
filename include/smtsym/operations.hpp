// ============================================================================
// smtsym/operations.hpp - Smart constructors over symbolic values
// ============================================================================
//
// Each builder returns an SVal whose node is created on first observation
// (through the context's cache) by State::new_expr.  Nothing is evaluated:
// applying sv_plus to two constants still yields an addition node.
//
// Callers keep sharing by reusing the returned SVal; rebuilding the same
// term from scratch is still deduplicated by the expression store.
//
// Operand kinds are checked eagerly and a mismatch raises ValidationError.
//
// ============================================================================

#ifndef SMTSYM_OPERATIONS_HPP
#define SMTSYM_OPERATIONS_HPP

#include "smtsym/node.hpp"
#include "smtsym/sval.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace smtsym {

// ── Generic application ─────────────────────────────────────────────────────

/// Apply op to args, producing a value of kind k.
SVal sv_apply(const Kind& k, const Op& op, const std::vector<SVal>& args);

// ── Arithmetic ──────────────────────────────────────────────────────────────

SVal sv_plus(const SVal& a, const SVal& b);
SVal sv_times(const SVal& a, const SVal& b);
SVal sv_minus(const SVal& a, const SVal& b);
SVal sv_uneg(const SVal& a);
SVal sv_abs(const SVal& a);
SVal sv_quot(const SVal& a, const SVal& b);
SVal sv_rem(const SVal& a, const SVal& b);

// ── Comparisons (boolean result) ────────────────────────────────────────────

SVal sv_eq(const SVal& a, const SVal& b);
SVal sv_neq(const SVal& a, const SVal& b);
SVal sv_lt(const SVal& a, const SVal& b);
SVal sv_gt(const SVal& a, const SVal& b);
SVal sv_le(const SVal& a, const SVal& b);
SVal sv_ge(const SVal& a, const SVal& b);

// ── Boolean ─────────────────────────────────────────────────────────────────

SVal sv_and(const SVal& a, const SVal& b);
SVal sv_or(const SVal& a, const SVal& b);
SVal sv_xor(const SVal& a, const SVal& b);
SVal sv_not(const SVal& a);

SVal sv_ite(const SVal& c, const SVal& t, const SVal& e);

// ── Bit-level ───────────────────────────────────────────────────────────────

SVal sv_shl(const SVal& a, std::int32_t n);
SVal sv_shr(const SVal& a, std::int32_t n);
SVal sv_rol(const SVal& a, std::int32_t n);
SVal sv_ror(const SVal& a, std::int32_t n);

/// Bits hi down to lo of a bounded value, as an unsigned word.
SVal sv_extract(std::int32_t hi, std::int32_t lo, const SVal& a);

/// Concatenation of two bounded values, a in the high bits.
SVal sv_join(const SVal& a, const SVal& b);

SVal sv_kind_cast(const Kind& to, const SVal& a);

// ── Labels, uninterpreted functions, tables ─────────────────────────────────

/// Attach a comment to a value.  The label does not change its meaning.
SVal sv_label(const std::string& text, const SVal& a);

/// Apply the uninterpreted function `name`, declaring it with the argument
/// kinds and result kind on first observation.
SVal sv_uninterpreted(const std::string& name, const Kind& result,
                      const std::vector<SVal>& args,
                      const std::optional<std::vector<std::string>>& code = std::nullopt);

/// elements[index], or out_of_bounds when the index is out of range.  The
/// elements are interned as a lookup table.
SVal sv_select(const std::vector<SVal>& elements, const SVal& out_of_bounds,
               const SVal& index);

// ── Floating point and pseudo-booleans ──────────────────────────────────────

/// An IEEE-754 operation with result kind k.  Operations that round take
/// the rounding mode as their first argument.
SVal sv_fp(FPOpKind op, const Kind& k, const std::vector<SVal>& args);

/// Value conversion of a into kind `to` under the given rounding mode.
SVal sv_fp_cast(const Kind& to, const SVal& rounding, const SVal& a);

/// Bit reinterpretation of a as kind `to`.
SVal sv_fp_reinterpret(const Kind& to, const SVal& a);

/// Pseudo-boolean constraint over boolean args.
SVal sv_pb(PBOpKind op, const std::vector<std::int32_t>& coeffs, std::int32_t bound,
           const std::vector<SVal>& args);

}  // namespace smtsym

#endif  // SMTSYM_OPERATIONS_HPP
