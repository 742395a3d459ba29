// ============================================================================
// node.cpp - Operation records, canonicalisation and debug rendering
// ============================================================================

#include "smtsym/node.hpp"

#include <algorithm>
#include <functional>
#include <sstream>
#include <stdexcept>

namespace smtsym {

// ── SW ──────────────────────────────────────────────────────────────────────

std::string SW::to_string() const {
    return "s" + std::to_string(id);
}

SW false_sw() { return SW{Kind::boolean(), kFalseNode}; }
SW true_sw()  { return SW{Kind::boolean(), kTrueNode}; }

bool needs_existentials(const std::vector<Quantifier>& qs) noexcept {
    return std::find(qs.begin(), qs.end(), Quantifier::EX) != qs.end();
}

const char* rounding_mode_smtlib_name(RoundingMode rm) noexcept {
    switch (rm) {
        case RoundingMode::RoundNearestTiesToEven: return "RNE";
        case RoundingMode::RoundNearestTiesToAway: return "RNA";
        case RoundingMode::RoundTowardPositive:    return "RTP";
        case RoundingMode::RoundTowardNegative:    return "RTN";
        case RoundingMode::RoundTowardZero:        return "RTZ";
    }
    return "?";
}

// ── op_kind_name ────────────────────────────────────────────────────────────

const char* op_kind_name(OpKind k) noexcept {
    switch (k) {
        case OpKind::Plus:          return "+";
        case OpKind::Times:         return "*";
        case OpKind::Minus:         return "-";
        case OpKind::UNeg:          return "-";
        case OpKind::Abs:           return "abs";
        case OpKind::Quot:          return "quot";
        case OpKind::Rem:           return "rem";
        case OpKind::Equal:         return "==";
        case OpKind::NotEqual:      return "/=";
        case OpKind::LessThan:      return "<";
        case OpKind::GreaterThan:   return ">";
        case OpKind::LessEq:        return "<=";
        case OpKind::GreaterEq:     return ">=";
        case OpKind::Ite:           return "if_then_else";
        case OpKind::And:           return "&";
        case OpKind::Or:            return "|";
        case OpKind::XOr:           return "^";
        case OpKind::Not:           return "~";
        case OpKind::Shl:           return "<<";
        case OpKind::Shr:           return ">>";
        case OpKind::Rol:           return "<<<";
        case OpKind::Ror:           return ">>>";
        case OpKind::Extract:       return "choose";
        case OpKind::Join:          return "#";
        case OpKind::LkUp:          return "lookup";
        case OpKind::ArrEq:         return "array_eq";
        case OpKind::ArrRead:       return "select";
        case OpKind::KindCast:      return "cast";
        case OpKind::Uninterpreted: return "[uninterpreted]";
        case OpKind::Label:         return "[label]";
        case OpKind::IEEEFP:        return "fp";
        case OpKind::PseudoBoolean: return "pb";
    }
    return "?";
}

bool is_commutative(OpKind k) noexcept {
    switch (k) {
        case OpKind::Plus:
        case OpKind::Times:
        case OpKind::Equal:
        case OpKind::NotEqual:
        case OpKind::And:
        case OpKind::Or:
        case OpKind::XOr:
            return true;
        default:
            return false;
    }
}

static const char* fp_op_name(FPOpKind k) noexcept {
    switch (k) {
        case FPOpKind::Cast:            return "fp.cast";
        case FPOpKind::Reinterpret:     return "to_fp";
        case FPOpKind::Abs:             return "fp.abs";
        case FPOpKind::Neg:             return "fp.neg";
        case FPOpKind::Add:             return "fp.add";
        case FPOpKind::Sub:             return "fp.sub";
        case FPOpKind::Mul:             return "fp.mul";
        case FPOpKind::Div:             return "fp.div";
        case FPOpKind::FMA:             return "fp.fma";
        case FPOpKind::Sqrt:            return "fp.sqrt";
        case FPOpKind::Rem:             return "fp.rem";
        case FPOpKind::RoundToIntegral: return "fp.roundToIntegral";
        case FPOpKind::Min:             return "fp.min";
        case FPOpKind::Max:             return "fp.max";
        case FPOpKind::ObjEqual:        return "=";
        case FPOpKind::IsNormal:        return "fp.isNormal";
        case FPOpKind::IsSubnormal:     return "fp.isSubnormal";
        case FPOpKind::IsZero:          return "fp.isZero";
        case FPOpKind::IsInfinite:      return "fp.isInfinite";
        case FPOpKind::IsNaN:           return "fp.isNaN";
        case FPOpKind::IsNegative:      return "fp.isNegative";
        case FPOpKind::IsPositive:      return "fp.isPositive";
    }
    return "?";
}

static const char* pb_op_name(PBOpKind k) noexcept {
    switch (k) {
        case PBOpKind::AtMost:  return "PB_AtMost";
        case PBOpKind::AtLeast: return "PB_AtLeast";
        case PBOpKind::Exactly: return "PB_Exactly";
        case PBOpKind::Le:      return "PB_Le";
        case PBOpKind::Ge:      return "PB_Ge";
        case PBOpKind::Eq:      return "PB_Eq";
    }
    return "?";
}

// ── Op constructors ─────────────────────────────────────────────────────────

Op Op::plain(OpKind k) {
    Op op;
    op.kind = k;
    return op;
}

Op Op::shl(std::int32_t n) { Op op = plain(OpKind::Shl); op.i = n; return op; }
Op Op::shr(std::int32_t n) { Op op = plain(OpKind::Shr); op.i = n; return op; }
Op Op::rol(std::int32_t n) { Op op = plain(OpKind::Rol); op.i = n; return op; }
Op Op::ror(std::int32_t n) { Op op = plain(OpKind::Ror); op.i = n; return op; }

Op Op::extract(std::int32_t hi, std::int32_t lo) {
    Op op = plain(OpKind::Extract);
    op.i = hi;
    op.j = lo;
    return op;
}

Op Op::lkup(const LookupInfo& info) {
    Op op = plain(OpKind::LkUp);
    op.lookup = info;
    return op;
}

Op Op::arr_eq(std::int32_t a, std::int32_t b) {
    Op op = plain(OpKind::ArrEq);
    op.i = a;
    op.j = b;
    return op;
}

Op Op::arr_read(std::int32_t a) {
    Op op = plain(OpKind::ArrRead);
    op.i = a;
    return op;
}

Op Op::kind_cast(const Kind& f, const Kind& t) {
    Op op = plain(OpKind::KindCast);
    op.from = f;
    op.to = t;
    return op;
}

Op Op::uninterpreted(const std::string& nm) {
    Op op = plain(OpKind::Uninterpreted);
    op.name = nm;
    return op;
}

Op Op::label(const std::string& text) {
    Op op = plain(OpKind::Label);
    op.name = text;
    return op;
}

Op Op::fp(FPOpKind k) {
    Op op = plain(OpKind::IEEEFP);
    op.fp_op = k;
    return op;
}

Op Op::fp_cast(const Kind& f, const Kind& t, const SW& rounding) {
    Op op = fp(FPOpKind::Cast);
    op.from = f;
    op.to = t;
    op.fp_rounding = rounding;
    return op;
}

Op Op::fp_reinterpret(const Kind& f, const Kind& t) {
    Op op = fp(FPOpKind::Reinterpret);
    op.from = f;
    op.to = t;
    return op;
}

Op Op::pseudo_boolean(PBOpKind k, std::vector<std::int32_t> coeffs,
                      std::int32_t bound) {
    Op op = plain(OpKind::PseudoBoolean);
    op.pb_op = k;
    op.pb_coeffs = std::move(coeffs);
    op.pb_bound = bound;
    return op;
}

// ── Op equality ─────────────────────────────────────────────────────────────

bool Op::operator==(const Op& o) const noexcept {
    return kind == o.kind &&
           i == o.i &&
           j == o.j &&
           name == o.name &&
           from == o.from &&
           to == o.to &&
           lookup.table == o.lookup.table &&
           lookup.index_kind == o.lookup.index_kind &&
           lookup.result_kind == o.lookup.result_kind &&
           lookup.length == o.lookup.length &&
           lookup.index == o.lookup.index &&
           lookup.out_of_bounds == o.lookup.out_of_bounds &&
           fp_op == o.fp_op &&
           fp_rounding == o.fp_rounding &&
           pb_op == o.pb_op &&
           pb_coeffs == o.pb_coeffs &&
           pb_bound == o.pb_bound;
}

// ── Hashing ─────────────────────────────────────────────────────────────────

static inline void mix(std::size_t& h, std::size_t v) noexcept {
    h ^= v + 0x9e3779b9 + (h << 6) + (h >> 2);
}

std::size_t OpHash::operator()(const Op& op) const noexcept {
    std::size_t h = static_cast<std::size_t>(op.kind);
    mix(h, std::hash<std::int32_t>{}(op.i));
    mix(h, std::hash<std::int32_t>{}(op.j));
    mix(h, std::hash<std::string>{}(op.name));
    mix(h, std::hash<std::int32_t>{}(op.lookup.table));
    mix(h, std::hash<NodeId>{}(op.lookup.index.id));
    mix(h, std::hash<NodeId>{}(op.lookup.out_of_bounds.id));
    mix(h, static_cast<std::size_t>(op.fp_op));
    mix(h, std::hash<NodeId>{}(op.fp_rounding.id));
    mix(h, static_cast<std::size_t>(op.pb_op));
    for (std::int32_t c : op.pb_coeffs) {
        mix(h, std::hash<std::int32_t>{}(c));
    }
    mix(h, std::hash<std::int32_t>{}(op.pb_bound));
    return h;
}

bool SBVExpr::operator==(const SBVExpr& o) const noexcept {
    if (op != o.op || args.size() != o.args.size()) return false;
    for (std::size_t k = 0; k < args.size(); ++k) {
        if (args[k] != o.args[k]) return false;
    }
    return true;
}

std::size_t SBVExprHash::operator()(const SBVExpr& e) const noexcept {
    std::size_t h = OpHash{}(e.op);
    for (const SW& sw : e.args) {
        mix(h, std::hash<NodeId>{}(sw.id));
    }
    return h;
}

// ── reorder ─────────────────────────────────────────────────────────────────

SBVExpr reorder(SBVExpr e) {
    if (e.args.size() == 2 && is_commutative(e.op.kind) && e.args[0] > e.args[1]) {
        std::swap(e.args[0], e.args[1]);
    }
    return e;
}

// ── Rendering ───────────────────────────────────────────────────────────────

std::string Op::to_string() const {
    switch (kind) {
        case OpKind::Shl:
        case OpKind::Shr:
        case OpKind::Rol:
        case OpKind::Ror:
            return std::string(op_kind_name(kind)) + std::to_string(i);
        case OpKind::Extract:
            return "choose [" + std::to_string(i) + ":" + std::to_string(j) + "]";
        case OpKind::LkUp:
            return "lookup(table" + std::to_string(lookup.table) + "(" +
                   lookup.index_kind.to_string() + " -> " +
                   lookup.result_kind.to_string() + ", " +
                   std::to_string(lookup.length) + "), " +
                   lookup.index.to_string() + ", " +
                   lookup.out_of_bounds.to_string() + ")";
        case OpKind::ArrEq:
            return "array_" + std::to_string(i) + " == array_" + std::to_string(j);
        case OpKind::ArrRead:
            return "select array_" + std::to_string(i);
        case OpKind::KindCast:
            return "cast_" + from.to_string() + "_" + to.to_string();
        case OpKind::Uninterpreted:
            return "[uninterpreted] " + name;
        case OpKind::Label:
            return "[label] " + name;
        case OpKind::IEEEFP:
            if (fp_op == FPOpKind::Cast) {
                return "(FP_Cast: " + from.to_string() + " -> " + to.to_string() +
                       ", using RM [" + fp_rounding.to_string() + "])";
            }
            if (fp_op == FPOpKind::Reinterpret) {
                return "(FP_Reinterpret: " + from.to_string() + " -> " + to.to_string() + ")";
            }
            return fp_op_name(fp_op);
        case OpKind::PseudoBoolean: {
            std::ostringstream oss;
            oss << pb_op_name(pb_op);
            if (!pb_coeffs.empty()) {
                oss << " [";
                for (std::size_t k = 0; k < pb_coeffs.size(); ++k) {
                    if (k) oss << ",";
                    oss << pb_coeffs[k];
                }
                oss << "]";
            }
            oss << " " << pb_bound;
            return oss.str();
        }
        default:
            return op_kind_name(kind);
    }
}

std::string SBVExpr::to_string() const {
    std::ostringstream oss;
    switch (op.kind) {
        case OpKind::Ite:
            if (args.size() == 3) {
                oss << "if " << args[0].to_string() << " then " << args[1].to_string()
                    << " else " << args[2].to_string();
                return oss.str();
            }
            break;
        case OpKind::Shl:
        case OpKind::Shr:
        case OpKind::Rol:
        case OpKind::Ror:
            if (args.size() == 1) {
                oss << args[0].to_string() << " " << op_kind_name(op.kind) << " " << op.i;
                return oss.str();
            }
            break;
        default:
            break;
    }
    if (args.size() == 2 && op.kind != OpKind::PseudoBoolean) {
        oss << args[0].to_string() << " " << op.to_string() << " " << args[1].to_string();
        return oss.str();
    }
    oss << op.to_string();
    for (const SW& sw : args) {
        oss << " " << sw.to_string();
    }
    return oss.str();
}

std::string SBVType::to_string() const {
    if (kinds.empty()) {
        throw std::runtime_error("smtsym: internal error, empty SBVType");
    }
    std::string out;
    for (std::size_t k = 0; k < kinds.size(); ++k) {
        if (k) out += " -> ";
        out += kinds[k].to_string();
    }
    return out;
}

}  // namespace smtsym
