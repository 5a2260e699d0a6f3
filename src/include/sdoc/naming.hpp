#pragma once

#include <string>
#include <string_view>

namespace sdoc {

  // Convert a snake_case schema name to the PascalCase name used in markup:
  // "font_weight" -> "FontWeight". Each '_'-separated word is title-cased
  // (first letter upper, remaining letters lower).
  std::string
  to_pascal_case(std::string_view name);

} // namespace sdoc
