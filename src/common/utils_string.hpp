#ifndef _COMMON_UTILS_STRING_H_
#define _COMMON_UTILS_STRING_H_

#include "base/defines.hpp"

#include <string>
#include <string_view>
#include <vector>
#include <cctype>
#include <limits>
#include <stdexcept>
#include <type_traits>

namespace jinglesdp {
namespace utils {
namespace string {

std::string to_upper(std::string_view str);
std::string to_lower(std::string_view str);
std::string join(const std::vector<std::string>& items, std::string_view separator);

// Parses a decimal integer, the whole string must be consumed and the value
// must fit in T. Throws std::invalid_argument otherwise.
template<typename T> 
T to_integer(std::string_view s) {
    static_assert(std::is_integral<T>::value, "T must be an integral type");
    const std::string str(s);
    const bool negative = !str.empty() && str[0] == '-';
    const size_t digits_begin = negative ? 1 : 0;
    if (str.size() <= digits_begin || !std::isdigit(static_cast<unsigned char>(str[digits_begin])) ||
        (negative && !std::is_signed<T>::value)) {
        throw std::invalid_argument("Invalid integer \"" + str + "\" in description");
    }
    size_t pos = 0;
    try {
        if constexpr (std::is_signed<T>::value) {
            const long long value = std::stoll(str, &pos);
            if (pos == str.size() && value >= std::numeric_limits<T>::min() && value <= std::numeric_limits<T>::max()) {
                return static_cast<T>(value);
            }
        } else {
            const unsigned long long value = std::stoull(str, &pos);
            if (pos == str.size() && value <= std::numeric_limits<T>::max()) {
                return static_cast<T>(value);
            }
        }
    } catch (const std::out_of_range&) {
        // Falls through to the error below.
    }
    throw std::invalid_argument("Invalid integer \"" + str + "\" in description");
}

} // namespace string
} // namespace utils
} // namespace jinglesdp

#endif
