#include "common/utils_string.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace jinglesdp {
namespace utils {
namespace string {

std::string to_upper(std::string_view str) {
    std::string upper(str);
    std::transform(upper.begin(), upper.end(), upper.begin(), [](char c) {
        return char(std::toupper(static_cast<unsigned char>(c)));
    });
    return upper;
}

std::string to_lower(std::string_view str) {
    std::string lower(str);
    std::transform(lower.begin(), lower.end(), lower.begin(), [](char c) {
        return char(std::tolower(static_cast<unsigned char>(c)));
    });
    return lower;
}

std::string join(const std::vector<std::string>& items, std::string_view separator) {
    std::ostringstream oss;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            oss << separator;
        }
        oss << items[i];
    }
    return oss.str();
}

} // namespace string
} // namespace utils
} // namespace jinglesdp
