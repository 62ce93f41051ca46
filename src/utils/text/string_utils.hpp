#pragma once

#include <string>

namespace Arachne {
namespace Utils {
namespace Text {

std::string trim(const std::string& str);
std::string to_lower(const std::string& str);
bool        iequals(const std::string& a, const std::string& b);

}  // namespace Text
}  // namespace Utils
}  // namespace Arachne
