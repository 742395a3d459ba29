// ============================================================================
// cache.cpp - Cache token generation
// ============================================================================

#include "smtsym/cache.hpp"

#include <atomic>

namespace smtsym {

CacheToken next_cache_token() noexcept {
    // Values may be created on any thread (e.g. one per case-split branch),
    // so the generator itself is atomic even though tables are not.
    static std::atomic<CacheToken> counter{1};
    return counter.fetch_add(1, std::memory_order_relaxed);
}

}  // namespace smtsym
