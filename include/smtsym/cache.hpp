// ============================================================================
// smtsym/cache.hpp - Identity-preserving memoisation of deferred builders
// ============================================================================
//
// Symbolic values are built lazily: a value holds a computation over the
// construction context that produces its node when first needed.  Running
// that computation again each time the value is observed would allocate
// duplicate nodes and break sharing.  Instead:
//
//   - cache(f) wraps f without running it and stamps the wrapper with a
//     fresh monotonic CacheToken.  Copies of the wrapper share the token.
//   - uncache(c, st) runs f the first time the token is seen by st and
//     returns the stored result on every later observation.
//
// The per-context table groups entries into hash buckets of (token, value)
// pairs; lookups compare tokens inside the bucket, so two tokens that land
// in the same bucket are never confused.
//
// This is not a general memo utility and provides no locking: a context is
// only ever driven by one thread.
//
// ============================================================================

#ifndef SMTSYM_CACHE_HPP
#define SMTSYM_CACHE_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <unordered_map>
#include <utility>
#include <vector>

namespace smtsym {

class State;

// ── CacheToken ──────────────────────────────────────────────────────────────

using CacheToken = std::uint64_t;

/// Next process-unique token.  Tokens are never reused.
CacheToken next_cache_token() noexcept;

// ── Cached ──────────────────────────────────────────────────────────────────

template <typename T>
class Cached {
public:
    using Fn = std::function<T(State&)>;

    explicit Cached(Fn fn)
        : fn_(std::make_shared<const Fn>(std::move(fn))),
          token_(next_cache_token()) {}

    CacheToken token() const noexcept { return token_; }

    /// Run the wrapped computation unconditionally.  Use uncache() instead.
    T evaluate(State& st) const { return (*fn_)(st); }

private:
    std::shared_ptr<const Fn> fn_;
    CacheToken                token_;
};

template <typename T>
Cached<T> cache(std::function<T(State&)> fn) {
    return Cached<T>(std::move(fn));
}

// ── TokenHash ───────────────────────────────────────────────────────────────
// Folds the 64-bit token into a 32-bit bucket key.

struct TokenHash {
    std::size_t operator()(CacheToken t) const noexcept {
        std::uint64_t x = t * 0x9e3779b97f4a7c15ULL;
        return static_cast<std::size_t>(static_cast<std::uint32_t>(x >> 32));
    }
};

// ── CacheTable ──────────────────────────────────────────────────────────────

template <typename T, typename Hasher = TokenHash>
class CacheTable {
public:
    /// Pointer to the stored value for this token, or nullptr.
    const T* find(CacheToken token) const {
        auto it = buckets_.find(Hasher{}(token));
        if (it == buckets_.end()) return nullptr;
        for (const auto& entry : it->second) {
            if (entry.first == token) return &entry.second;
        }
        return nullptr;
    }

    void insert(CacheToken token, T value) {
        buckets_[Hasher{}(token)].emplace_back(token, std::move(value));
        ++size_;
    }

    std::size_t size() const noexcept { return size_; }
    std::size_t bucket_count() const noexcept { return buckets_.size(); }

    void clear() noexcept {
        buckets_.clear();
        size_ = 0;
    }

private:
    std::unordered_map<std::size_t, std::vector<std::pair<CacheToken, T>>> buckets_;
    std::size_t size_ = 0;
};

/// Generic uncaching against an explicit table.  The computation may itself
/// uncache other values (and so grow the table); the result is stored only
/// after it returns.
template <typename T, typename Hasher>
T uncache_with(CacheTable<T, Hasher>& table, const Cached<T>& c, State& st) {
    if (const T* hit = table.find(c.token())) {
        return *hit;
    }
    T r = c.evaluate(st);
    table.insert(c.token(), r);
    return r;
}

}  // namespace smtsym

#endif  // SMTSYM_CACHE_HPP
