// ============================================================================
// smtsym/z3_channel.hpp - In-process Z3 behind the ask/respond contract
// ============================================================================
//
// Z3Channel feeds SMT-Lib 2 text commands to an embedded Z3 context and
// returns its textual response, one response per command.  It stands in
// for a solver subprocess: queries see only the AskFn it hands out.
//
// Usage:
//   Z3Channel z3;
//   z3.set_timeout(5);
//   QueryState qs = begin_interactive_session(st, z3.ask_function(), cfg);
//   run_query(q, qs);
//
// The channel does not interpret the commands or the responses.
//
// ============================================================================

#ifndef SMTSYM_Z3_CHANNEL_HPP
#define SMTSYM_Z3_CHANNEL_HPP

#include "smtsym/query.hpp"

#include <z3++.h>

#include <cstddef>
#include <string>

namespace smtsym {

class Z3Channel {
public:
    Z3Channel();

    Z3Channel(const Z3Channel&) = delete;
    Z3Channel& operator=(const Z3Channel&) = delete;

    /// Evaluate one command and return the solver's response verbatim.
    /// Throws Error if Z3 reports an API failure.
    std::string ask(const std::string& cmd);

    /// Solver-side time budget for each check, in seconds.  0 disables it.
    /// Sent as a command, so it counts towards commands_sent().
    void set_timeout(int seconds);

    /// An AskFn bound to this channel.  The channel must outlive it.
    AskFn ask_function();

    std::size_t commands_sent() const noexcept { return sent_; }

private:
    z3::context ctx_;
    std::size_t sent_ = 0;
};

}  // namespace smtsym

#endif  // SMTSYM_Z3_CHANNEL_HPP
