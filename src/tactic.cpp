// ============================================================================
// tactic.cpp - Debug renderers for tactics and objectives
// ============================================================================

#include "smtsym/tactic.hpp"

#include <sstream>

namespace smtsym {

std::string OptimizeStyle::to_string() const {
    switch (kind) {
        case Kind::Lexicographic: return "lexicographic";
        case Kind::Independent:   return "independent";
        case Kind::Pareto:
            if (max_fronts) return "pareto, at most " + std::to_string(*max_fronts) + " fronts";
            return "pareto";
    }
    return "?";
}

std::string Penalty::to_string() const {
    if (is_default) return "default penalty";
    std::string out = "penalty " + weight;
    if (group) out += " in group " + *group;
    return out;
}

// ── tactic_to_string ────────────────────────────────────────────────────────

static void render_tactic(std::ostringstream& oss, const Tactic<SW>& t) {
    switch (t.kind) {
        case TacticKind::CaseSplit: {
            oss << "CaseSplit" << (t.flag ? " (verbose)" : "") << " [";
            for (std::size_t i = 0; i < t.branches.size(); ++i) {
                const auto& b = t.branches[i];
                if (i) oss << ", ";
                oss << "(\"" << b.name << "\", " << b.condition.to_string() << ", [";
                for (std::size_t k = 0; k < b.tactics.size(); ++k) {
                    if (k) oss << ", ";
                    render_tactic(oss, b.tactics[k]);
                }
                oss << "])";
            }
            oss << "]";
            break;
        }
        case TacticKind::CheckCaseVacuity:
            oss << "CheckCaseVacuity " << (t.flag ? "on" : "off");
            break;
        case TacticKind::ParallelCase:
            oss << "ParallelCase";
            break;
        case TacticKind::CheckConstrVacuity:
            oss << "CheckConstrVacuity " << (t.flag ? "on" : "off");
            break;
        case TacticKind::StopAfter:
            oss << "StopAfter " << t.seconds << "s";
            break;
        case TacticKind::CheckUsing:
            oss << "CheckUsing \"" << t.text << "\"";
            break;
        case TacticKind::UseSolver:
            oss << "UseSolver " << (t.solver ? t.solver->to_string() : "<none>");
            break;
        case TacticKind::SetOptions: {
            oss << "SetOptions [";
            for (std::size_t i = 0; i < t.options.size(); ++i) {
                if (i) oss << ", ";
                oss << t.options[i].to_smtlib();
            }
            oss << "]";
            break;
        }
        case TacticKind::OptimizePriority:
            oss << "OptimizePriority " << t.style.to_string();
            break;
        case TacticKind::QueryUsing:
            oss << "QueryUsing <Query>";
            break;
    }
}

std::string tactic_to_string(const Tactic<SW>& t) {
    std::ostringstream oss;
    render_tactic(oss, t);
    return oss.str();
}

// ── objective_to_string ─────────────────────────────────────────────────────

std::string objective_to_string(const ResolvedObjective& o) {
    const std::string pair = "(" + o.value.first.to_string() + ", "
                           + o.value.second.to_string() + ")";
    switch (o.kind) {
        case ObjectiveKind::Minimize:
            return "Minimize \"" + o.name + "\" " + pair;
        case ObjectiveKind::Maximize:
            return "Maximize \"" + o.name + "\" " + pair;
        case ObjectiveKind::AssertSoft:
            return "AssertSoft \"" + o.name + "\" " + pair + " " + o.penalty.to_string();
    }
    return "?";
}

}  // namespace smtsym
