// ============================================================================
// smtsym/node.hpp - Nodes, operations and expression applications
// ============================================================================
//
// Design notes:
//
//   A symbolic run records the host computation as a single-static-assignment
//   graph.  Each slot is identified by a NodeId; a typed reference to a slot
//   is an SW (symbolic word) = (Kind, NodeId).
//
//   Reserved ids:
//     0 : kInvalidNode, "no node"
//     1 : the constant false
//     2 : the constant true
//   All other nodes are numbered 3, 4, ... in allocation order.
//
//   An SBVExpr is an operation applied to an ordered list of SWs.  Binary
//   commutative operations are canonicalised by reorder() so that a + b and
//   b + a intern to the same node.
//
//   Op is a flat tagged record: OpKind selects the operation and the payload
//   fields that are meaningful for it.  Unused payload fields keep their
//   default values so that structural equality and hashing stay exact.
//
// ============================================================================

#ifndef SMTSYM_NODE_HPP
#define SMTSYM_NODE_HPP

#include "smtsym/kind.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace smtsym {

// ── NodeId ──────────────────────────────────────────────────────────────────

using NodeId = std::uint32_t;
inline constexpr NodeId kInvalidNode = 0;
inline constexpr NodeId kFalseNode   = 1;
inline constexpr NodeId kTrueNode    = 2;
inline constexpr NodeId kFirstFreeNode = 3;

// ── SW ──────────────────────────────────────────────────────────────────────
// Ordered by NodeId, then Kind.  Equality is by NodeId alone: within one
// context every id is allocated exactly once.

struct SW {
    Kind   kind;
    NodeId id = kInvalidNode;

    bool operator==(const SW& o) const noexcept { return id == o.id; }
    bool operator!=(const SW& o) const noexcept { return id != o.id; }
    bool operator<(const SW& o) const noexcept {
        if (id != o.id) return id < o.id;
        return kind < o.kind;
    }
    bool operator>(const SW& o) const noexcept { return o < *this; }

    /// "s<id>"
    std::string to_string() const;
};

inline const Kind& sw_kind(const SW& sw) noexcept { return sw.kind; }

SW false_sw();
SW true_sw();

// ── Quantifier ──────────────────────────────────────────────────────────────

enum class Quantifier : std::uint8_t { ALL, EX };

bool needs_existentials(const std::vector<Quantifier>& qs) noexcept;

// ── RoundingMode ────────────────────────────────────────────────────────────

enum class RoundingMode : std::uint8_t {
    RoundNearestTiesToEven,
    RoundNearestTiesToAway,
    RoundTowardPositive,
    RoundTowardNegative,
    RoundTowardZero
};

/// SMT-Lib name: RNE, RNA, RTP, RTN, RTZ.
const char* rounding_mode_smtlib_name(RoundingMode rm) noexcept;

// ── FPOpKind / PBOpKind ─────────────────────────────────────────────────────

enum class FPOpKind : std::uint8_t {
    Cast,             // value conversion, uses from/to kinds and a rounding SW
    Reinterpret,      // bit reinterpretation, uses from/to kinds
    Abs, Neg, Add, Sub, Mul, Div, FMA, Sqrt, Rem, RoundToIntegral,
    Min, Max, ObjEqual,
    IsNormal, IsSubnormal, IsZero, IsInfinite, IsNaN, IsNegative, IsPositive
};

enum class PBOpKind : std::uint8_t {
    AtMost,    // at most k
    AtLeast,   // at least k
    Exactly,   // exactly k
    Le,        // weighted at most k
    Ge,        // weighted at least k
    Eq         // weighted exactly k
};

// ── OpKind ──────────────────────────────────────────────────────────────────

enum class OpKind : std::uint8_t {
    Plus, Times, Minus, UNeg, Abs, Quot, Rem,
    Equal, NotEqual, LessThan, GreaterThan, LessEq, GreaterEq,
    Ite,
    And, Or, XOr, Not,
    Shl, Shr, Rol, Ror,    // amount in i
    Extract,               // bits i down to j
    Join,
    LkUp,                  // table lookup, see LookupInfo
    ArrEq,                 // arrays i and j
    ArrRead,               // array i
    KindCast,              // from -> to
    Uninterpreted,         // name
    Label,                 // name
    IEEEFP,                // fp_op
    PseudoBoolean          // pb_op, pb_coeffs, pb_bound
};

const char* op_kind_name(OpKind k) noexcept;

/// Whether reorder() may swap the operands of a binary application.
bool is_commutative(OpKind k) noexcept;

// ── LookupInfo ──────────────────────────────────────────────────────────────

struct LookupInfo {
    std::int32_t table = -1;
    Kind         index_kind;
    Kind         result_kind;
    std::int32_t length = 0;
    SW           index;         // the index node
    SW           out_of_bounds; // value when the index is out of range
};

// ── Op ──────────────────────────────────────────────────────────────────────

struct Op {
    OpKind       kind = OpKind::Plus;
    std::int32_t i = 0;
    std::int32_t j = 0;
    std::string  name;
    Kind         from;
    Kind         to;
    LookupInfo   lookup;
    FPOpKind     fp_op = FPOpKind::Abs;
    SW           fp_rounding;
    PBOpKind     pb_op = PBOpKind::AtMost;
    std::vector<std::int32_t> pb_coeffs;
    std::int32_t pb_bound = 0;

    static Op plain(OpKind k);
    static Op shl(std::int32_t n);
    static Op shr(std::int32_t n);
    static Op rol(std::int32_t n);
    static Op ror(std::int32_t n);
    static Op extract(std::int32_t hi, std::int32_t lo);
    static Op lkup(const LookupInfo& info);
    static Op arr_eq(std::int32_t a, std::int32_t b);
    static Op arr_read(std::int32_t a);
    static Op kind_cast(const Kind& f, const Kind& t);
    static Op uninterpreted(const std::string& nm);
    static Op label(const std::string& text);
    static Op fp(FPOpKind k);
    static Op fp_cast(const Kind& f, const Kind& t, const SW& rounding);
    static Op fp_reinterpret(const Kind& f, const Kind& t);
    static Op pseudo_boolean(PBOpKind k, std::vector<std::int32_t> coeffs,
                             std::int32_t bound);

    bool operator==(const Op& o) const noexcept;
    bool operator!=(const Op& o) const noexcept { return !(*this == o); }

    std::string to_string() const;
};

struct OpHash {
    std::size_t operator()(const Op& op) const noexcept;
};

// ── SBVExpr ─────────────────────────────────────────────────────────────────

struct SBVExpr {
    Op              op;
    std::vector<SW> args;

    bool operator==(const SBVExpr& o) const noexcept;

    std::string to_string() const;
};

struct SBVExprHash {
    std::size_t operator()(const SBVExpr& e) const noexcept;
};

/// Swap the operands of a binary commutative application when the first
/// operand is greater than the second.
SBVExpr reorder(SBVExpr e);

// ── SBVType ─────────────────────────────────────────────────────────────────
// Argument kinds followed by the result kind.  A constant has one entry.

struct SBVType {
    std::vector<Kind> kinds;

    bool operator==(const SBVType& o) const noexcept { return kinds == o.kinds; }
    bool operator!=(const SBVType& o) const noexcept { return kinds != o.kinds; }
    bool operator<(const SBVType& o) const noexcept { return kinds < o.kinds; }

    /// "SWord8 -> SBool".  Throws std::runtime_error on an empty type.
    std::string to_string() const;
};

// ── SBVPgm ──────────────────────────────────────────────────────────────────

struct SBVPgm {
    std::vector<std::pair<SW, SBVExpr>> assignments;
};

}  // namespace smtsym

#endif  // SMTSYM_NODE_HPP
