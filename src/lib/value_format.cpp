#include <sdoc/value_format.hpp>

#include <charconv>
#include <cmath>
#include <stdexcept>

namespace sdoc {

  std::string
  format(const std::string& value) {
    return value;
  }

  std::string
  format(bool value) {
    return value ? "True" : "False";
  }

  std::string
  format(std::int64_t value) {
    return std::to_string(value);
  }

  std::string
  format(double value) {
    if (std::isinf(value)) return value > 0 ? "Infinity" : "-Infinity";
    if (std::isnan(value)) return "NaN";

    // Shortest round-trip form: 150.0 -> "150", 0.5 -> "0.5"
    char buf[64];
    auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), value);
    if (ec != std::errc{})
      throw std::runtime_error("failed to format floating-point value");
    return std::string(buf, ptr);
  }

} // namespace sdoc
