#pragma once

#include <ostream>
#include <string_view>

namespace sdoc {

  inline void
  escape_attribute(std::ostream& os, std::string_view text) {
    for (char c : text) {
      switch (c) {
        case '<':
          os << "&lt;";
          break;
        case '>':
          os << "&gt;";
          break;
        case '&':
          os << "&amp;";
          break;
        case '"':
          os << "&quot;";
          break;
        case '\n':
          os << "&#10;";
          break;
        default:
          os << c;
          break;
      }
    }
  }

} // namespace sdoc
