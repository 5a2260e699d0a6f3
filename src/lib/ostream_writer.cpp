#include <sdoc/ostream_writer.hpp>
#include <sdoc/xml_escape.hpp>

#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace sdoc {

  struct ostream_writer::impl {
    std::ostream& os;
    write_options options;
    bool declaration_written = false;

    // Pending tag state: start_element() buffers its name; attribute()
    // accumulates onto this buffer; the tag is flushed (written) when child
    // content arrives or end_element() is called.
    bool tag_pending = false;
    std::string pending_name;

    struct pending_attr {
      std::string name;
      std::string value;
    };

    std::vector<pending_attr> pending_attrs;

    struct element_frame {
      std::string name;
      bool has_children;
    };

    std::vector<element_frame> stack;

    impl(std::ostream& os, write_options options)
        : os(os), options(std::move(options)) {}

    void
    write_indent(std::size_t depth) {
      if (options.indent.empty()) { return; }
      os << '\n';
      for (std::size_t i = 0; i < depth; ++i) {
        os << options.indent;
      }
    }

    // Write the buffered opening tag to the stream.
    void
    flush_pending_tag() {
      if (!tag_pending) { return; }
      tag_pending = false;

      os << '<' << pending_name;
      for (const auto& attr : pending_attrs) {
        os << ' ' << attr.name << "=\"";
        escape_attribute(os, attr.value);
        os << '"';
      }

      pending_attrs.clear();
    }

    // Ensure the most recent open tag is flushed and closed with '>'.
    // Called before writing a child element.
    void
    flush_and_close_tag() {
      if (tag_pending) {
        flush_pending_tag();
        os << '>';
      }
    }
  };

  ostream_writer::ostream_writer(std::ostream& os, write_options options)
      : impl_(std::make_unique<impl>(os, std::move(options))) {}

  ostream_writer::~ostream_writer() = default;
  ostream_writer::ostream_writer(ostream_writer&&) noexcept = default;
  ostream_writer&
  ostream_writer::operator=(ostream_writer&&) noexcept = default;

  void
  ostream_writer::start_element(std::string_view name) {
    if (impl_->stack.empty() && impl_->options.xml_declaration &&
        !impl_->declaration_written) {
      impl_->os << "<?xml version=\"1.0\" encoding=\""
                << impl_->options.declared_encoding << "\"?>\n";
      impl_->declaration_written = true;
    }

    // Flush any previously open tag (it now has child content)
    impl_->flush_and_close_tag();

    if (!impl_->stack.empty()) {
      impl_->stack.back().has_children = true;
      impl_->write_indent(impl_->stack.size());
    }

    impl_->stack.push_back({std::string(name), false});
    impl_->tag_pending = true;
    impl_->pending_name = std::string(name);
  }

  void
  ostream_writer::end_element() {
    if (impl_->stack.empty())
      throw std::logic_error("end_element() without a matching start_element()");

    auto frame = std::move(impl_->stack.back());
    impl_->stack.pop_back();

    if (impl_->tag_pending) {
      // Self-closing: no child content was written
      impl_->flush_pending_tag();
      impl_->os << "/>";
      return;
    }

    if (frame.has_children) { impl_->write_indent(impl_->stack.size()); }
    impl_->os << "</" << frame.name << '>';
  }

  void
  ostream_writer::attribute(std::string_view name, std::string_view value) {
    if (!impl_->tag_pending)
      throw std::logic_error("attribute '" + std::string(name) +
                             "' written outside of a start tag");
    impl_->pending_attrs.push_back({std::string(name), std::string(value)});
  }

} // namespace sdoc
