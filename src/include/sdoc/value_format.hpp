#pragma once

#include <cstdint>
#include <string>

namespace sdoc {

  // Canonical attribute text for scalar values
  std::string
  format(const std::string& value);
  std::string
  format(bool value);
  std::string
  format(std::int64_t value);
  std::string
  format(double value);

} // namespace sdoc
