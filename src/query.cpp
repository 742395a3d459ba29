// ============================================================================
// query.cpp - Query handshake and session setup
// ============================================================================

#include "smtsym/query.hpp"
#include "smtsym/directives.hpp"
#include "smtsym/errors.hpp"
#include "smtsym/utils.hpp"

#include <cstdint>
#include <iostream>
#include <limits>

namespace smtsym {

std::string QueryState::send(const std::string& cmd) {
    if (config.verbose) std::cerr << "[send] " << cmd << "\n";
    std::string reply = ask(cmd);
    if (config.verbose) std::cerr << "[recv] " << reply << "\n";
    return reply;
}

std::string timeout_command(int seconds) {
    if (seconds < 0) {
        throw ValidationError("timeout must be >= 0, got " + std::to_string(seconds));
    }
    const std::int64_t ms = static_cast<std::int64_t>(seconds) * 1000;
    if (ms > std::numeric_limits<std::uint32_t>::max()) {
        throw ValidationError("timeout of " + std::to_string(seconds) + "s is out of range");
    }
    return "(set-option :timeout " + std::to_string(ms) + ")";
}

std::vector<SMTResult> run_query(const Query& q, QueryState& qs) {
    const std::string reply = qs.send(kHandshakeCommand);
    if (trim(reply) != kHandshakeReply) {
        throw ProtocolHandshakeError(kHandshakeCommand, kHandshakeReply, reply);
    }

    if (qs.context.state) {
        if (auto secs = stop_after_seconds(qs.context.state->tactics())) {
            const std::string cmd = timeout_command(*secs);
            const std::string ack = qs.send(cmd);
            if (trim(ack) != kHandshakeReply) {
                throw ProtocolHandshakeError(cmd, kHandshakeReply, ack);
            }
        }
    }
    return q(qs);
}

void query(State& st, Query q) {
    add_sval_tactic(st, Tactic<SVal>::query_using(std::move(q)));
}

QueryState begin_interactive_session(State& st, AskFn ask, SMTConfig cfg) {
    st.switch_to_interactive_mode();

    QueryState qs;
    qs.ask = std::move(ask);
    qs.config = std::move(cfg);
    qs.context.state = &st;
    for (const auto& in : st.inputs()) {
        if (in.quantifier == Quantifier::EX) qs.context.skolems.push_back(in.name);
    }

    // The back end replaces these once it knows how to read models.
    const SMTConfig snapshot = qs.config;
    qs.default_result = [snapshot](bool) {
        return std::vector<SMTResult>{SMTResult::unknown(snapshot, SMTModel{})};
    };
    qs.get_model = [snapshot]() {
        return std::vector<SMTResult>{SMTResult::unknown(snapshot, SMTModel{})};
    };
    return qs;
}

}  // namespace smtsym
