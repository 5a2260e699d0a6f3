#include <sdoc/geometry.hpp>
#include <sdoc/value_format.hpp>

namespace sdoc {

  std::string
  triplet::to_string() const {
    return format(x) + ',' + format(y) + ',' + format(z);
  }

  std::string
  quadruplet::to_string() const {
    return format(top) + ',' + format(right) + ',' + format(bottom) + ',' +
           format(left);
  }

} // namespace sdoc
