// ============================================================================
// smtsym/array.hpp - Symbolic arrays as provenance handles
// ============================================================================
//
// An SArr is not storage: it is a deferred reference to a handle in the
// context's array store.  Each handle records how it was derived:
//
//   Free(init?)            new_sarr
//   Reset(src, v)          reset_sarr
//   Mutate(src, i, v)      write_sarr
//   Merge(c, a, b)         merge_sarr
//
// Sources are always allocated before the handle that names them, so the
// store is a DAG in allocation order.  Every array-producing operation takes
// handle = store size and grows the store by one.  All of them except
// new_sarr are cached, so observing the same SArr twice allocates once.
//
// Arrays map directly onto the solver's array theory and cannot be used in
// Concrete or CodeGen runs.
//
// ============================================================================

#ifndef SMTSYM_ARRAY_HPP
#define SMTSYM_ARRAY_HPP

#include "smtsym/cache.hpp"
#include "smtsym/state.hpp"
#include "smtsym/sval.hpp"

#include <functional>
#include <optional>
#include <string>
#include <utility>

namespace smtsym {

struct SArr {
    std::pair<Kind, Kind> kinds;   // index kind, element kind
    Cached<ArrayIndex>    handle;
};

/// Uncache against st's array-handle cache.
ArrayIndex uncache_ai(const Cached<ArrayIndex>& c, State& st);

/// "array_<i>"
std::string default_array_name(ArrayIndex i);

/// Create an array, named by mk_name(handle), optionally with every cell
/// initialised to init.
SArr new_sarr(State& st, const std::pair<Kind, Kind>& kinds,
              const std::function<std::string(ArrayIndex)>& mk_name = default_array_name,
              const std::optional<SVal>& init = std::nullopt);

/// The element at index.  Yields a node, not an array.
SVal read_sarr(const SArr& a, const SVal& index);

/// Every element of a set to v.
SArr reset_sarr(const SArr& a, const SVal& v);

/// a with the element at index replaced by v.
SArr write_sarr(const SArr& a, const SVal& index, const SVal& v);

/// if cond then a else b, element-wise.
SArr merge_sarr(const SVal& cond, const SArr& a, const SArr& b);

/// Boolean equality of two arrays.
SVal eq_sarr(const SArr& a, const SArr& b);

}  // namespace smtsym

#endif  // SMTSYM_ARRAY_HPP
