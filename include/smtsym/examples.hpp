// ============================================================================
// smtsym/examples.hpp - Built-in symbolic constructions
// ============================================================================
//
// Small constructions that drive the engine end to end.  They are used by
// the CLI (--example NAME) and by the self-tests.
//
//   sum            two 32-bit inputs x, y and the output x + y, split on
//                  the sign of x
//   arrays         a write followed by a read of a 8-bit indexed array
//   tables         a constant lookup table indexed by a symbolic byte
//   goals          minimise / maximise / soft assertion over two integers
//   uninterpreted  an uninterpreted function constrained by an axiom
//
// ============================================================================

#ifndef SMTSYM_EXAMPLES_HPP
#define SMTSYM_EXAMPLES_HPP

#include "smtsym/state.hpp"

#include <string>
#include <vector>

namespace smtsym {

const std::vector<std::string>& example_names();

/// Run the named construction against st.  Throws std::runtime_error for an
/// unknown name; errors of the construction itself propagate unchanged.
void build_example(const std::string& name, State& st);

}  // namespace smtsym

#endif  // SMTSYM_EXAMPLES_HPP
