// ============================================================================
// smtsym/query.hpp - Interactive query sessions
// ============================================================================
//
// A query talks to the solver through a synchronous ask function: one
// SMT-Lib command in, exactly one response out.  There is no in-process
// cancellation; time limits are passed to the solver (see StopAfter).
//
// Every session starts with a handshake: the command
//
//   (set-option :print-success true)
//
// must be answered with "success".  Anything else aborts the session with
// ProtocolHandshakeError before the user's query runs.
//
// ============================================================================

#ifndef SMTSYM_QUERY_HPP
#define SMTSYM_QUERY_HPP

#include "smtsym/solver_config.hpp"
#include "smtsym/state.hpp"

#include <functional>
#include <string>
#include <vector>

namespace smtsym {

using AskFn = std::function<std::string(const std::string&)>;

inline constexpr const char* kHandshakeCommand = "(set-option :print-success true)";
inline constexpr const char* kHandshakeReply   = "success";

// ── QueryContext ────────────────────────────────────────────────────────────

struct QueryContext {
    State*                   state = nullptr;   // not owned
    std::vector<std::string> skolems;           // existential inputs, in order
};

// ── QueryState ──────────────────────────────────────────────────────────────

struct QueryState {
    AskFn                                       ask;
    SMTConfig                                   config;
    QueryContext                                context;
    std::function<std::vector<SMTResult>(bool)> default_result;
    std::function<std::vector<SMTResult>()>     get_model;
    bool                                        ignore_exit_code = false;
    int                                         assertion_stack_depth = 0;

    /// Send one command and wait for its response.  Echoed to stderr when
    /// the configuration is verbose.
    std::string send(const std::string& cmd);
};

/// The SMT-Lib command setting a per-check budget of `seconds` (0 = none).
/// Throws ValidationError for a negative budget or one whose millisecond
/// count does not fit the solver's unsigned 32-bit option.
std::string timeout_command(int seconds);

/// Perform the handshake, then run q.  A StopAfter budget registered on the
/// session's state is sent to the solver after the handshake.
std::vector<SMTResult> run_query(const Query& q, QueryState& qs);

/// Install q as the query of the current run.
void query(State& st, Query q);

/// Switch st from Proof to Interactive and prepare a session over ask.
QueryState begin_interactive_session(State& st, AskFn ask, SMTConfig cfg);

}  // namespace smtsym

#endif  // SMTSYM_QUERY_HPP
