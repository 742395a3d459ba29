// ============================================================================
// kind.cpp - Kind ordering and rendering
// ============================================================================

#include "smtsym/kind.hpp"

#include <stdexcept>
#include <tuple>

namespace smtsym {

bool Kind::has_sign() const noexcept {
    switch (tag) {
        case KindTag::Bool:      return false;
        case KindTag::Bounded:   return is_signed;
        case KindTag::Unbounded: return true;
        case KindTag::Real:      return true;
        case KindTag::UserSort:  return false;
        case KindTag::Float:     return true;
        case KindTag::Double:    return true;
    }
    return false;
}

std::int32_t Kind::int_size() const {
    switch (tag) {
        case KindTag::Bool:    return 1;
        case KindTag::Bounded: return width;
        case KindTag::Float:   return 32;
        case KindTag::Double:  return 64;
        case KindTag::Unbounded:
        case KindTag::Real:
        case KindTag::UserSort:
            break;
    }
    throw std::runtime_error("Kind::int_size: kind has no fixed size: " + to_string());
}

bool Kind::operator==(const Kind& o) const noexcept {
    return tag == o.tag &&
           is_signed == o.is_signed &&
           width == o.width &&
           sort_name == o.sort_name &&
           constructors == o.constructors;
}

bool Kind::operator<(const Kind& o) const noexcept {
    return std::tie(tag, is_signed, width, sort_name, constructors) <
           std::tie(o.tag, o.is_signed, o.width, o.sort_name, o.constructors);
}

std::string Kind::to_string() const {
    switch (tag) {
        case KindTag::Bool:      return "SBool";
        case KindTag::Bounded:
            return (is_signed ? "SInt" : "SWord") + std::to_string(width);
        case KindTag::Unbounded: return "SInteger";
        case KindTag::Real:      return "SReal";
        case KindTag::UserSort:  return sort_name;
        case KindTag::Float:     return "SFloat";
        case KindTag::Double:    return "SDouble";
    }
    return "?";
}

}  // namespace smtsym
