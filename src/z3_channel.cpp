// ============================================================================
// z3_channel.cpp - Embedded Z3 command channel
// ============================================================================

#include "smtsym/z3_channel.hpp"
#include "smtsym/errors.hpp"
#include "smtsym/query.hpp"

namespace smtsym {

Z3Channel::Z3Channel() = default;

std::string Z3Channel::ask(const std::string& cmd) {
    ++sent_;
    try {
        Z3_string out = Z3_eval_smtlib2_string(ctx_, cmd.c_str());
        ctx_.check_error();
        return out ? std::string(out) : std::string();
    } catch (const z3::exception& e) {
        throw Error("z3: " + std::string(e.msg()) + " (while evaluating " + cmd + ")");
    }
}

void Z3Channel::set_timeout(int seconds) {
    // The command context behind Z3_eval_smtlib2_string only honours
    // options set through the command stream.
    ask(timeout_command(seconds));
}

AskFn Z3Channel::ask_function() {
    return [this](const std::string& cmd) { return ask(cmd); };
}

}  // namespace smtsym
