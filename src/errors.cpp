// ============================================================================
// errors.cpp - Diagnostic text for the engine's exceptions
// ============================================================================

#include "smtsym/errors.hpp"

namespace smtsym {

static std::string interactive_message(const std::vector<std::string>& details) {
    std::string msg = "\n*** smtsym: Unsupported interactive/query mode feature.\n";
    for (const auto& line : details) {
        msg += "***  " + line + "\n";
    }
    msg += "*** smtsym: Please report this as a feature request!";
    return msg;
}

UnsupportedInInteractiveMode::UnsupportedInInteractiveMode(
        const std::vector<std::string>& details)
    : Error(interactive_message(details)) {}

static std::string handshake_message(const std::string& sent,
                                     const std::string& expected,
                                     const std::string& received) {
    return "\n*** smtsym: Failed to initiate contact with the solver!\n"
           "***   Sent    : " + sent + "\n"
           "***   Expected: " + expected + "\n"
           "***   Received: " + received + "\n"
           "*** Try running in verbose mode for further information.";
}

ProtocolHandshakeError::ProtocolHandshakeError(const std::string& sent,
                                               const std::string& expected,
                                               const std::string& received)
    : Error(handshake_message(sent, expected, received)),
      sent_(sent),
      received_(received) {}

}  // namespace smtsym
