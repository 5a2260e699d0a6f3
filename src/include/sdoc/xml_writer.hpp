#pragma once

#include <string_view>

namespace sdoc {

  class xml_writer {
  public:
    virtual ~xml_writer() = default;

    virtual void
    start_element(std::string_view name) = 0;

    virtual void
    end_element() = 0;

    virtual void
    attribute(std::string_view name, std::string_view value) = 0;
  };

} // namespace sdoc
