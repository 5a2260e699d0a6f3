#pragma once

#include <sdoc/xml_writer.hpp>

#include <memory>
#include <ostream>
#include <string>

namespace sdoc {

  struct write_options {
    // Written once per nesting level before each tag; empty writes the
    // document on a single line.
    std::string indent;
    bool xml_declaration = false;
    // Encoding named in the declaration. The stream itself is always UTF-8.
    std::string declared_encoding = "utf-8";
  };

  class ostream_writer : public xml_writer {
  public:
    explicit ostream_writer(std::ostream& os, write_options options = {});
    ~ostream_writer() override;

    ostream_writer(const ostream_writer&) = delete;
    ostream_writer&
    operator=(const ostream_writer&) = delete;
    ostream_writer(ostream_writer&&) noexcept;
    ostream_writer&
    operator=(ostream_writer&&) noexcept;

    void
    start_element(std::string_view name) override;

    void
    end_element() override;

    void
    attribute(std::string_view name, std::string_view value) override;

  private:
    struct impl;
    std::unique_ptr<impl> impl_;
  };

} // namespace sdoc
