// ============================================================================
// smtsym/errors.hpp - Error taxonomy of the symbolic engine
// ============================================================================
//
// Every violation is fatal for the construction in progress: builders check
// their own preconditions and throw.  There is no partial recovery; callers
// treat a construction as all-or-nothing.
//
//   ValidationError              malformed identifiers, duplicate names,
//                                signature mismatches, bad probabilities,
//                                arrays/kinds not usable in the current mode
//   ModeViolation                operation not legal in the current run mode
//   UnsupportedInInteractiveMode mutation not allowed once a session started
//   ProtocolHandshakeError       query channel did not acknowledge contact
//
// ============================================================================

#ifndef SMTSYM_ERRORS_HPP
#define SMTSYM_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <vector>

namespace smtsym {

class Error : public std::runtime_error {
public:
    explicit Error(const std::string& what) : std::runtime_error(what) {}
};

class ValidationError : public Error {
public:
    explicit ValidationError(const std::string& what)
        : Error("smtsym: " + what) {}
};

class ModeViolation : public Error {
public:
    explicit ModeViolation(const std::string& what)
        : Error("smtsym: " + what) {}
};

class UnsupportedInInteractiveMode : public Error {
public:
    /// details are the lines describing the rejected operation.
    explicit UnsupportedInInteractiveMode(const std::vector<std::string>& details);
};

class ProtocolHandshakeError : public Error {
public:
    ProtocolHandshakeError(const std::string& sent,
                           const std::string& expected,
                           const std::string& received);

    const std::string& sent() const noexcept { return sent_; }
    const std::string& received() const noexcept { return received_; }

private:
    std::string sent_;
    std::string received_;
};

}  // namespace smtsym

#endif  // SMTSYM_ERRORS_HPP
