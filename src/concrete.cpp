// ============================================================================
// concrete.cpp - Concrete value ordering, rendering and sampling
// ============================================================================

#include "smtsym/concrete.hpp"
#include "smtsym/errors.hpp"

#include <cmath>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace smtsym {

// ── Floating comparison ─────────────────────────────────────────────────────
// -1 / 0 / +1 with NaN == NaN and NaN above everything.  +0 and -0 are equal.

template <typename F>
static int compare_floating(F a, F b) noexcept {
    const bool an = std::isnan(a);
    const bool bn = std::isnan(b);
    if (an || bn) {
        if (an && bn) return 0;
        return an ? 1 : -1;
    }
    if (a < b) return -1;
    if (b < a) return 1;
    return 0;
}

static int compare_val(const CWVal& a, const CWVal& b) noexcept {
    if (a.index() != b.index()) {
        return a.index() < b.index() ? -1 : 1;
    }
    switch (a.index()) {
        case 0: {
            auto x = std::get<std::int64_t>(a);
            auto y = std::get<std::int64_t>(b);
            return x < y ? -1 : (y < x ? 1 : 0);
        }
        case 1:
            return compare_floating(std::get<float>(a), std::get<float>(b));
        case 2:
            return compare_floating(std::get<double>(a), std::get<double>(b));
        case 3: {
            const auto& x = std::get<AlgRealText>(a);
            const auto& y = std::get<AlgRealText>(b);
            return x < y ? -1 : (y < x ? 1 : 0);
        }
        case 4: {
            const auto& x = std::get<UserSortValue>(a);
            const auto& y = std::get<UserSortValue>(b);
            return x < y ? -1 : (y < x ? 1 : 0);
        }
        default:
            break;
    }
    return 0;
}

// ── CW ──────────────────────────────────────────────────────────────────────

bool CW::is_negative_zero() const noexcept {
    if (const float* f = std::get_if<float>(&val)) {
        return *f == 0.0f && std::signbit(*f);
    }
    if (const double* d = std::get_if<double>(&val)) {
        return *d == 0.0 && std::signbit(*d);
    }
    return false;
}

bool CW::operator==(const CW& o) const noexcept {
    return kind == o.kind && compare_val(val, o.val) == 0;
}

bool CW::operator<(const CW& o) const noexcept {
    if (kind != o.kind) return kind < o.kind;
    return compare_val(val, o.val) < 0;
}

std::string CW::to_string() const {
    std::ostringstream oss;
    switch (val.index()) {
        case 0: {
            std::int64_t v = std::get<std::int64_t>(val);
            if (kind.is_boolean()) {
                oss << (v != 0 ? "true" : "false");
            } else if (kind.is_bounded() && !kind.is_signed) {
                oss << static_cast<std::uint64_t>(v);
            } else {
                oss << v;
            }
            break;
        }
        case 1: {
            float f = std::get<float>(val);
            if (std::isnan(f))      oss << "NaN";
            else if (std::isinf(f)) oss << (f < 0 ? "-Infinity" : "Infinity");
            else                    oss << f;
            break;
        }
        case 2: {
            double d = std::get<double>(val);
            if (std::isnan(d))      oss << "NaN";
            else if (std::isinf(d)) oss << (d < 0 ? "-Infinity" : "Infinity");
            else                    oss << d;
            break;
        }
        case 3:
            oss << std::get<AlgRealText>(val).text;
            break;
        case 4:
            oss << std::get<UserSortValue>(val).name;
            break;
        default:
            break;
    }
    if (!kind.is_boolean()) {
        oss << " :: " << kind.to_string();
    }
    return oss.str();
}

// ── Constructors ────────────────────────────────────────────────────────────

CW false_cw() { return CW{Kind::boolean(), std::int64_t{0}}; }
CW true_cw()  { return CW{Kind::boolean(), std::int64_t{1}}; }
CW bool_cw(bool b) { return b ? true_cw() : false_cw(); }

CW integral_cw(const Kind& k, std::int64_t v) {
    if (k.tag != KindTag::Bool && k.tag != KindTag::Bounded &&
        k.tag != KindTag::Unbounded) {
        throw std::runtime_error("integral_cw: not an integral kind: " + k.to_string());
    }
    return CW{k, v};
}

CW float_cw(float f)   { return CW{Kind::fp_float(), f}; }
CW double_cw(double d) { return CW{Kind::fp_double(), d}; }

CW real_cw(const std::string& rational_text) {
    return CW{Kind::real(), AlgRealText{rational_text}};
}

bool cw_to_bool(const CW& cw) {
    if (!cw.kind.is_boolean()) {
        throw std::runtime_error("cw_to_bool: not a boolean value: " + cw.to_string());
    }
    return std::get<std::int64_t>(cw.val) != 0;
}

// ── random_cw ───────────────────────────────────────────────────────────────

CW random_cw(const Kind& k, std::mt19937_64& rng) {
    switch (k.tag) {
        case KindTag::Bool: {
            std::uniform_int_distribution<int> dist(0, 1);
            return bool_cw(dist(rng) == 1);
        }
        case KindTag::Bounded: {
            const std::int32_t w = k.width;
            std::uint64_t bits = rng();
            if (w < 64) {
                bits &= (std::uint64_t{1} << w) - 1;
                if (k.is_signed && w > 0 && (bits >> (w - 1)) != 0) {
                    // sign-extend
                    bits |= ~((std::uint64_t{1} << w) - 1);
                }
            }
            return CW{k, static_cast<std::int64_t>(bits)};
        }
        case KindTag::Unbounded: {
            std::uniform_int_distribution<std::int64_t> dist(
                std::numeric_limits<std::int32_t>::min(),
                std::numeric_limits<std::int32_t>::max());
            return CW{k, dist(rng)};
        }
        case KindTag::Real: {
            std::uniform_int_distribution<std::int64_t> num(-1000000, 1000000);
            std::uniform_int_distribution<std::int64_t> den(1, 1000000);
            return real_cw(std::to_string(num(rng)) + "/" + std::to_string(den(rng)));
        }
        case KindTag::Float: {
            std::uniform_real_distribution<float> dist(-1.0e6f, 1.0e6f);
            return float_cw(dist(rng));
        }
        case KindTag::Double: {
            std::uniform_real_distribution<double> dist(-1.0e12, 1.0e12);
            return double_cw(dist(rng));
        }
        case KindTag::UserSort:
            break;
    }
    throw ModeViolation("Cannot draw a random value of uninterpreted sort " +
                        k.to_string() + " in concrete simulation mode.");
}

}  // namespace smtsym
