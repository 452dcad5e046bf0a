#pragma once

#include <string_view>

namespace lpakx {

// Shell-style pattern match against a whole entry path
//   *      any run of characters, including '/'
//   ?      exactly one character
//   [set]  one character from set; ranges (a-z) and negation ([!...]) allowed,
//          with hyphens and reversed ranges resolved as Python's fnmatch does
// Case-sensitive and anchored at both ends.
bool globMatch(std::string_view pattern, std::string_view text);

} // namespace lpakx
