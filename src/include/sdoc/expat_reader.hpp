#pragma once

#include <sdoc/xml_reader.hpp>

#include <memory>
#include <string_view>

namespace sdoc {

  // Parses the whole input up front with libexpat; throws
  // std::runtime_error naming the line and column of malformed markup.
  class expat_reader : public xml_reader {
  public:
    explicit expat_reader(std::string_view xml);
    ~expat_reader() override;

    expat_reader(const expat_reader&) = delete;
    expat_reader&
    operator=(const expat_reader&) = delete;
    expat_reader(expat_reader&&) noexcept;
    expat_reader&
    operator=(expat_reader&&) noexcept;

    bool
    read() override;

    xml_node_type
    node_type() const override;

    const std::string&
    name() const override;

    std::size_t
    attribute_count() const override;

    const std::string&
    attribute_name(std::size_t index) const override;

    std::string_view
    attribute_value(std::size_t index) const override;

    std::string_view
    text() const override;

    std::size_t
    depth() const override;

    std::size_t
    line() const override;

  private:
    struct impl;
    std::unique_ptr<impl> impl_;
  };

} // namespace sdoc
