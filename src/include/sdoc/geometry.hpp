#pragma once

#include <optional>
#include <ostream>
#include <string>

namespace sdoc {

  // Three numbers rendered "x,y,z".
  struct triplet {
    double x = 0.0;
    double y = 0.0;
    double z = 0.0;

    std::string
    to_string() const;

    bool
    operator==(const triplet&) const = default;

    friend std::ostream&
    operator<<(std::ostream& os, const triplet& t) {
      return os << t.to_string();
    }
  };

  using location = triplet;
  using rotation = triplet;

  struct dimensions : triplet {
    dimensions() = default;

    dimensions(double width, double height, double depth = 0.0)
        : triplet{width, height, depth} {}

    double
    width() const {
      return x;
    }

    double
    height() const {
      return y;
    }

    double
    depth() const {
      return z;
    }
  };

  // Four edge values rendered "top,right,bottom,left". Omitted edges follow
  // the usual shorthand: right and bottom default to top, left to right.
  struct quadruplet {
    double top = 0.0;
    double right = 0.0;
    double bottom = 0.0;
    double left = 0.0;

    quadruplet() = default;

    explicit quadruplet(double top, std::optional<double> right = std::nullopt,
                        std::optional<double> bottom = std::nullopt,
                        std::optional<double> left = std::nullopt)
        : top(top), right(right.value_or(top)), bottom(bottom.value_or(top)),
          left(left.value_or(this->right)) {}

    std::string
    to_string() const;

    bool
    operator==(const quadruplet&) const = default;

    friend std::ostream&
    operator<<(std::ostream& os, const quadruplet& q) {
      return os << q.to_string();
    }
  };

  using padding = quadruplet;
  using margin = quadruplet;
  using feather = quadruplet;
  using crop_range = quadruplet;

} // namespace sdoc
