#pragma once

#include <sdoc/xml_escape.hpp>

#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace sdoc {

  class xml_reader;
  class xml_writer;

  class element_attribute {
    std::string name_;
    std::string value_;

  public:
    element_attribute() = default;

    element_attribute(std::string name, std::string value)
        : name_(std::move(name)), value_(std::move(value)) {}

    const std::string&
    name() const {
      return name_;
    }

    const std::string&
    value() const {
      return value_;
    }

    void
    set_value(std::string value) {
      value_ = std::move(value);
    }

    bool
    operator==(const element_attribute&) const = default;

    friend std::ostream&
    operator<<(std::ostream& os, const element_attribute& a) {
      os << a.name_ << "=\"";
      escape_attribute(os, a.value_);
      return os << '"';
    }
  };

  // In-memory markup tree produced by serialization. Attributes keep their
  // insertion order.
  class element {
    std::string name_;
    std::vector<element_attribute> attributes_;
    std::vector<element> children_;

  public:
    element() = default;

    explicit element(std::string name,
                     std::vector<element_attribute> attributes = {},
                     std::vector<element> children = {})
        : name_(std::move(name)), attributes_(std::move(attributes)),
          children_(std::move(children)) {}

    // Consumes the element the reader is positioned on, up to its end tag.
    // Whitespace-only text is skipped; other text is an error.
    explicit element(xml_reader& reader);

    static element
    parse(std::string_view xml);

    void
    write(xml_writer& writer) const;

    const std::string&
    name() const {
      return name_;
    }

    const std::vector<element_attribute>&
    attributes() const {
      return attributes_;
    }

    const std::vector<element>&
    children() const {
      return children_;
    }

    const std::string*
    find_attribute(std::string_view name) const;

    // Replaces the value in place when the name is already present.
    void
    set_attribute(std::string name, std::string value);

    // The returned reference is invalidated by the next append().
    element&
    append(element child);

    // Declared here, defaulted out-of-line after the class is complete.
    bool
    operator==(const element&) const;

    friend std::ostream&
    operator<<(std::ostream& os, const element& e) {
      os << '<' << e.name_;
      for (const auto& attr : e.attributes_) {
        os << ' ' << attr;
      }
      if (e.children_.empty()) { return os << "/>"; }
      os << '>';
      for (const auto& child : e.children_) {
        os << child;
      }
      return os << "</" << e.name_ << '>';
    }
  };

  inline bool
  element::operator==(const element& other) const {
    return name_ == other.name_ && attributes_ == other.attributes_ &&
           children_ == other.children_;
  }

  // Render through an ostream_writer configured with `indent` (no
  // declaration).
  std::string
  to_string(const element& root, std::string_view indent = {});

} // namespace sdoc
