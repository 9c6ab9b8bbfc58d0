#ifndef IP_DOT_HPP
#define IP_DOT_HPP

#include <string_view>

// Textual address classification, used to split connection source
// addresses by family.

namespace IP {
bool is_v4(std::string_view addr);
bool is_v6(std::string_view addr);
bool is_address(std::string_view addr);
} // namespace IP

#endif // IP_DOT_HPP
