#include <sdoc/color.hpp>

#include <algorithm>
#include <array>
#include <charconv>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace sdoc {

  namespace {

    double
    clamp_unit(double v) {
      return std::clamp(v, 0.0, 1.0);
    }

    // Nearest byte, so that from_hex() text survives to_string() unchanged.
    int
    to_byte(double c) {
      return static_cast<int>(std::lround(255.0 * c));
    }

    int
    parse_byte(std::string_view hex, std::string_view whole) {
      int value = 0;
      auto [ptr, ec] =
          std::from_chars(hex.data(), hex.data() + hex.size(), value, 16);
      if (ec != std::errc{} || ptr != hex.data() + hex.size() || value < 0)
        throw std::invalid_argument("invalid hex colour: '" +
                                    std::string(whole) + "'");
      return value;
    }

    struct named_color {
      std::string_view name;
      double r, g, b, a;
    };

    constexpr std::array<named_color, 23> presets = {{
        {"red", 1, 0, 0, 1},
        {"green", 0, 1, 0, 1},
        {"blue", 0, 0, 1, 1},
        {"white", 1, 1, 1, 1},
        {"black", 0, 0, 0, 1},
        {"transparent_white", 1, 1, 1, 0},
        {"transparent_black", 0, 0, 0, 0},
        {"lime", 0, 1, 0, 1},
        {"salmon", 0.98, 0.5, 0.45, 1},
        {"cyan", 0, 1, 1, 1},
        {"magenta", 1, 0, 1, 1},
        {"yellow", 1, 1, 0, 1},
        {"navy", 0, 0, 0.5, 1},
        {"olive", 0.5, 0.5, 0, 1},
        {"teal", 0, 0.5, 0.5, 1},
        {"maroon", 0.5, 0, 0, 1},
        {"purple", 0.5, 0, 0.5, 1},
        {"gray", 0.5, 0.5, 0.5, 1},
        {"silver", 0.75, 0.75, 0.75, 1},
        {"orange", 1, 0.65, 0, 1},
        {"brown", 0.65, 0.16, 0.16, 1},
        {"pink", 1, 0.75, 0.8, 1},
        {"gold", 1, 0.84, 0, 1},
    }};

  } // namespace

  color::color(double r, double g, double b, double a)
      : r_(clamp_unit(r)), g_(clamp_unit(g)), b_(clamp_unit(b)),
        a_(clamp_unit(a)) {}

  color
  color::from_hex(std::string_view hex) {
    std::string_view digits = hex;
    if (digits.starts_with("#")) digits.remove_prefix(1);

    if (digits.size() != 6 && digits.size() != 8)
      throw std::invalid_argument(
          "invalid hex colour: '" + std::string(hex) +
          "' (expected 6 or 8 hexadecimal digits)");

    int r = parse_byte(digits.substr(0, 2), hex);
    int g = parse_byte(digits.substr(2, 2), hex);
    int b = parse_byte(digits.substr(4, 2), hex);
    int a = digits.size() == 8 ? parse_byte(digits.substr(6, 2), hex) : 255;
    return from_int(r, g, b, a);
  }

  color
  color::from_int(int r, int g, int b, int a) {
    return {r / 255.0, g / 255.0, b / 255.0, a / 255.0};
  }

  color
  color::preset(std::string_view name) {
    for (const auto& p : presets) {
      if (p.name == name) return {p.r, p.g, p.b, p.a};
    }
    throw std::invalid_argument("unknown colour preset: '" +
                                std::string(name) + "'");
  }

  std::string
  color::to_string() const {
    static constexpr char digits[] = "0123456789ABCDEF";
    std::string out = "#";
    for (double c : {a_, r_, g_, b_}) {
      int byte = to_byte(c);
      out += digits[(byte >> 4) & 0xF];
      out += digits[byte & 0xF];
    }
    return out;
  }

} // namespace sdoc
