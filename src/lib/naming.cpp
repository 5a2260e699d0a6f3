#include <sdoc/naming.hpp>

namespace sdoc {

  namespace {

    bool
    is_upper(char c) {
      return c >= 'A' && c <= 'Z';
    }

    bool
    is_lower(char c) {
      return c >= 'a' && c <= 'z';
    }

    char
    to_upper(char c) {
      if (is_lower(c)) return static_cast<char>(c - 'a' + 'A');
      return c;
    }

    char
    to_lower(char c) {
      if (is_upper(c)) return static_cast<char>(c - 'A' + 'a');
      return c;
    }

  } // namespace

  std::string
  to_pascal_case(std::string_view name) {
    std::string result;
    result.reserve(name.size());

    // A letter starts a new word when it follows the separator or any
    // other non-letter ("3d_view" -> "3DView").
    bool word_start = true;
    for (char c : name) {
      if (c == '_') {
        word_start = true;
        continue;
      }

      if (is_upper(c) || is_lower(c)) {
        result += word_start ? to_upper(c) : to_lower(c);
        word_start = false;
      } else {
        result += c;
        word_start = true;
      }
    }

    return result;
  }

} // namespace sdoc
