#pragma once

#include <ostream>
#include <string>
#include <string_view>

namespace sdoc {

  // RGBA colour with components in [0, 1]. Rendered as "#AARRGGBB".
  class color {
    double r_ = 0.0;
    double g_ = 0.0;
    double b_ = 0.0;
    double a_ = 1.0;

  public:
    color() = default;

    // Components are clamped to [0, 1].
    color(double r, double g, double b, double a = 1.0);

    // "#RRGGBB" or "#RRGGBBAA", '#' optional. Throws std::invalid_argument.
    static color
    from_hex(std::string_view hex);

    static color
    from_int(int r, int g, int b, int a = 255);

    // Named preset ("red", "transparent_white", ...). Throws
    // std::invalid_argument for unknown names.
    static color
    preset(std::string_view name);

    static color
    red() {
      return {1.0, 0.0, 0.0};
    }

    static color
    green() {
      return {0.0, 1.0, 0.0};
    }

    static color
    blue() {
      return {0.0, 0.0, 1.0};
    }

    static color
    white() {
      return {1.0, 1.0, 1.0};
    }

    static color
    black() {
      return {0.0, 0.0, 0.0};
    }

    double
    r() const {
      return r_;
    }

    double
    g() const {
      return g_;
    }

    double
    b() const {
      return b_;
    }

    double
    a() const {
      return a_;
    }

    color
    with_alpha(double a) const {
      return {r_, g_, b_, a};
    }

    std::string
    to_string() const;

    bool
    operator==(const color&) const = default;

    friend std::ostream&
    operator<<(std::ostream& os, const color& c) {
      return os << c.to_string();
    }
  };

} // namespace sdoc
