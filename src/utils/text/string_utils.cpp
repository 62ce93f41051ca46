#include "string_utils.hpp"
#include <algorithm>
#include <cctype>

namespace Arachne {
namespace Utils {
namespace Text {

std::string trim(const std::string& str) {
    size_t first = str.find_first_not_of(" \t\r\n\f\v");
    if (std::string::npos == first) {
        return "";
    }
    size_t last = str.find_last_not_of(" \t\r\n\f\v");
    return str.substr(first, (last - first + 1));
}

std::string to_lower(const std::string& str) {
    std::string lower = str;
    std::transform(
        lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return std::tolower(c); });
    return lower;
}

bool iequals(const std::string& a, const std::string& b) {
    return a.size() == b.size()
           && std::equal(a.begin(), a.end(), b.begin(), [](unsigned char c1, unsigned char c2) {
                  return std::tolower(c1) == std::tolower(c2);
              });
}

}  // namespace Text
}  // namespace Utils
}  // namespace Arachne
