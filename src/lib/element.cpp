#include <sdoc/element.hpp>
#include <sdoc/expat_reader.hpp>
#include <sdoc/ostream_writer.hpp>
#include <sdoc/xml_reader.hpp>
#include <sdoc/xml_writer.hpp>

#include <algorithm>
#include <sstream>
#include <stdexcept>
#include <string>

namespace sdoc {

  namespace {

    bool
    is_blank(std::string_view text) {
      return std::all_of(text.begin(), text.end(), [](char c) {
        return c == ' ' || c == '\t' || c == '\n' || c == '\r';
      });
    }

    void
    write_element(const element& elem, xml_writer& writer) {
      writer.start_element(elem.name());
      for (const auto& attr : elem.attributes()) {
        writer.attribute(attr.name(), attr.value());
      }
      for (const auto& child : elem.children()) {
        write_element(child, writer);
      }
      writer.end_element();
    }

  } // namespace

  element::element(xml_reader& reader) : name_(reader.name()) {
    for (std::size_t i = 0; i < reader.attribute_count(); ++i) {
      attributes_.emplace_back(reader.attribute_name(i),
                               std::string(reader.attribute_value(i)));
    }

    std::size_t start_depth = reader.depth();
    while (reader.read()) {
      switch (reader.node_type()) {
        case xml_node_type::start_element:
          children_.emplace_back(reader);
          break;
        case xml_node_type::characters:
          if (!is_blank(reader.text()))
            throw std::runtime_error(
                "unexpected text inside element '" + name_ + "' at line " +
                std::to_string(reader.line()));
          break;
        case xml_node_type::end_element:
          if (reader.depth() == start_depth) { return; }
          break;
      }
    }
    throw std::runtime_error("unexpected end of input while parsing element '" +
                             name_ + "'");
  }

  element
  element::parse(std::string_view xml) {
    expat_reader reader(xml);
    while (reader.read()) {
      if (reader.node_type() == xml_node_type::start_element)
        return element(reader);
    }
    throw std::runtime_error("XML parse error: no root element");
  }

  void
  element::write(xml_writer& writer) const {
    write_element(*this, writer);
  }

  const std::string*
  element::find_attribute(std::string_view name) const {
    for (const auto& attr : attributes_) {
      if (attr.name() == name) return &attr.value();
    }
    return nullptr;
  }

  void
  element::set_attribute(std::string name, std::string value) {
    for (auto& attr : attributes_) {
      if (attr.name() == name) {
        attr.set_value(std::move(value));
        return;
      }
    }
    attributes_.emplace_back(std::move(name), std::move(value));
  }

  element&
  element::append(element child) {
    children_.push_back(std::move(child));
    return children_.back();
  }

  std::string
  to_string(const element& root, std::string_view indent) {
    std::ostringstream os;
    write_options options;
    options.indent = std::string(indent);
    ostream_writer writer(os, std::move(options));
    root.write(writer);
    return os.str();
  }

} // namespace sdoc
