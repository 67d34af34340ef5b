#ifndef STRATA_CORE_PARSE_NUMBER_H_
#define STRATA_CORE_PARSE_NUMBER_H_

#include <cstdint>
#include <exception>
#include <limits>
#include <string>
#include <type_traits>

namespace strata {

// Parses a non-negative decimal integer that must fit in T. The whole string must
// be consumed; signs, blanks and values above numeric_limits<T>::max() are
// rejected. *out is only written on success.
template <typename T>
bool ParseNonNegative(const std::string& text, T* out) {
    static_assert(std::is_integral<T>::value, "integral type required");
    if (text.empty() || text[0] < '0' || text[0] > '9') return false;

    unsigned long long value = 0;
    size_t used = 0;
    try {
        value = std::stoull(text, &used, 10);
    } catch (const std::exception&) {
        // out of range of unsigned long long
        return false;
    }
    if (used != text.size()) return false;
    if (value > static_cast<unsigned long long>(std::numeric_limits<T>::max())) return false;

    *out = static_cast<T>(value);
    return true;
}

}  // namespace strata

#endif  // STRATA_CORE_PARSE_NUMBER_H_
