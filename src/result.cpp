// ============================================================================
// result.cpp - Result extraction, rendering and run orchestration
// ============================================================================

#include "smtsym/result.hpp"
#include "smtsym/utils.hpp"

#include <algorithm>
#include <sstream>

namespace smtsym {

// ── extract_symbolic_simulation_state ───────────────────────────────────────

Result extract_symbolic_simulation_state(const State& st) {
    Result r;
    r.kinds = st.used_kinds();
    r.traces = st.trace_info();

    for (const auto& [name, lines] : st.code_segments()) {
        r.code_segments.emplace_back(name, lines);
    }

    r.inputs = st.inputs();

    for (const auto& [key, sw] : st.constants()) {
        r.constants.emplace_back(sw, key.second);
    }
    std::sort(r.constants.begin(), r.constants.end(),
              [](const auto& a, const auto& b) { return a.first < b.first; });

    for (const auto& [key, idx] : st.tables()) {
        r.tables.push_back(TableEntry{idx, key.index_kind, key.result_kind, key.elements});
    }
    std::sort(r.tables.begin(), r.tables.end(),
              [](const TableEntry& a, const TableEntry& b) { return a.index < b.index; });

    const auto& arrays = st.arrays();
    for (std::size_t i = 0; i < arrays.size(); ++i) {
        r.arrays.emplace_back(static_cast<ArrayIndex>(i), arrays[i]);
    }

    for (const auto& [name, type] : st.uninterpreted()) {
        r.uninterpreted.emplace_back(name, type);
    }

    r.axioms      = st.axioms();
    r.program     = st.program();
    r.constraints = st.constraints();
    r.tactics     = st.tactics();
    r.goals       = st.goals();
    r.assertions  = st.assertions();
    r.outputs     = st.outputs();
    return r;
}

// ── Orchestration ───────────────────────────────────────────────────────────

std::unique_ptr<State> new_symbolic_state(RunMode mode) {
    return std::make_unique<State>(std::move(mode));
}

Result run_symbolic(bool is_sat, const SMTConfig& cfg,
                    const std::function<void(State&)>& f) {
    return run_symbolic_with_state(is_sat, cfg, f).second;
}

std::pair<std::unique_ptr<State>, Result>
run_symbolic_with_state(bool is_sat, const SMTConfig& cfg,
                        const std::function<void(State&)>& f) {
    auto st = new_symbolic_state(RunMode::proof(is_sat, cfg));
    f(*st);
    Result res = extract_symbolic_simulation_state(*st);
    return {std::move(st), std::move(res)};
}

// ── Result::to_string ───────────────────────────────────────────────────────

static std::string typed(const SW& sw) {
    return sw.to_string() + " :: " + sw.kind.to_string();
}

std::string Result::to_string() const {
    // A bare constant computation prints as its value.
    if (uninterpreted.empty() && axioms.empty() && constraints.empty()
        && outputs.size() == 1) {
        for (const auto& [sw, cw] : constants) {
            if (sw == outputs.front()) return cw.to_string();
        }
    }

    std::vector<std::string> out;

    std::vector<std::string> usorts;
    for (const auto& k : kinds) {
        if (!k.is_user_sort()) continue;
        if (k.constructors) {
            usorts.push_back(k.sort_name + " (" + join(*k.constructors, ", ") + ")");
        } else {
            usorts.push_back(k.sort_name);
        }
    }
    if (!usorts.empty()) {
        out.push_back("SORTS");
        for (const auto& s : usorts) out.push_back("  " + s);
    }

    out.push_back("INPUTS");
    for (const auto& in : inputs) {
        std::string line = "  " + typed(in.sw);
        if (in.quantifier == Quantifier::EX) line += ", existential";
        if (in.name != in.sw.to_string()) line += ", aliasing \"" + in.name + "\"";
        out.push_back(line);
    }

    out.push_back("CONSTANTS");
    for (const auto& [sw, cw] : constants) {
        out.push_back("  " + sw.to_string() + " = " + cw.to_string());
    }

    out.push_back("TABLES");
    for (const auto& t : tables) {
        std::string elts;
        for (std::size_t i = 0; i < t.elements.size(); ++i) {
            if (i) elts += ",";
            elts += t.elements[i].to_string();
        }
        out.push_back("  Table " + std::to_string(t.index) + " : " + t.index_kind.to_string()
                      + "->" + t.result_kind.to_string() + " = [" + elts + "]");
    }

    out.push_back("ARRAYS");
    for (const auto& [i, info] : arrays) {
        const std::string ni = "array_" + std::to_string(i);
        std::string line = "  " + ni + " :: " + info.kinds.first.to_string() + " -> "
                         + info.kinds.second.to_string();
        if (info.name != ni) line += ", aliasing \"" + info.name + "\"";
        line += "\n     Context: " + info.context.to_string();
        out.push_back(line);
    }

    out.push_back("UNINTERPRETED CONSTANTS");
    for (const auto& [name, type] : uninterpreted) {
        out.push_back("  [uninterpreted] " + name + " :: " + type.to_string());
    }

    out.push_back("USER GIVEN CODE SEGMENTS");
    for (const auto& [name, lines] : code_segments) {
        out.push_back("Variable: " + name);
        for (const auto& l : lines) out.push_back("  " + l);
    }

    out.push_back("AXIOMS");
    for (const auto& [name, lines] : axioms) {
        out.push_back("  -- user defined axiom: " + name + "\n  " + join(lines, "\n  "));
    }

    out.push_back("TACTICS");
    for (const auto& t : tactics) out.push_back(tactic_to_string(t));

    out.push_back("GOALS");
    for (const auto& g : goals) out.push_back(objective_to_string(g));

    out.push_back("DEFINE");
    for (const auto& [sw, e] : program.assignments) {
        out.push_back("  " + typed(sw) + " = " + e.to_string());
    }

    out.push_back("CONSTRAINTS");
    for (const auto& c : constraints) {
        out.push_back("  " + (c.name ? *c.name + ": " : std::string()) + c.sw.to_string());
    }

    out.push_back("ASSERTIONS");
    for (const auto& a : assertions) {
        out.push_back("    -- assertion: " + a.label + " "
                      + (a.location ? a.location->to_string() : std::string("[No location]"))
                      + ": " + a.condition.to_string());
    }

    out.push_back("OUTPUTS");
    for (const auto& o : outputs) out.push_back("  " + o.to_string());

    return join(out, "\n");
}

}  // namespace smtsym
