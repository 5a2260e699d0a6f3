#include <sdoc/expat_reader.hpp>

#include <expat.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace sdoc {

  namespace {

    struct markup_event {
      xml_node_type type;
      std::string name;
      std::string text;
      std::vector<std::pair<std::string, std::string>> attributes;
      std::size_t depth = 0;
      std::size_t line = 0;
    };

    using parser_handle =
        std::unique_ptr<std::remove_pointer_t<XML_Parser>,
                        decltype(&XML_ParserFree)>;

    // Everything expat reports while parsing, in document order. Adjacent
    // character data is merged into one event.
    struct event_log {
      XML_Parser parser = nullptr;
      std::vector<markup_event> events;
      std::size_t depth = 0;

      markup_event&
      record(xml_node_type type) {
        markup_event& ev = events.emplace_back();
        ev.type = type;
        ev.depth = depth;
        ev.line = static_cast<std::size_t>(XML_GetCurrentLineNumber(parser));
        return ev;
      }
    };

    void XMLCALL
    start_handler(void* data, const char* name, const char** atts) {
      auto* log = static_cast<event_log*>(data);
      ++log->depth;
      markup_event& ev = log->record(xml_node_type::start_element);
      ev.name = name;
      for (; *atts != nullptr; atts += 2)
        ev.attributes.emplace_back(atts[0], atts[1]);
    }

    void XMLCALL
    end_handler(void* data, const char* name) {
      auto* log = static_cast<event_log*>(data);
      log->record(xml_node_type::end_element).name = name;
      --log->depth;
    }

    void XMLCALL
    text_handler(void* data, const char* s, int len) {
      auto* log = static_cast<event_log*>(data);
      auto length = static_cast<std::size_t>(len);
      if (!log->events.empty() &&
          log->events.back().type == xml_node_type::characters) {
        log->events.back().text.append(s, length);
        return;
      }
      log->record(xml_node_type::characters).text.assign(s, length);
    }

  } // namespace

  struct expat_reader::impl {
    std::vector<markup_event> events;
    std::size_t position = 0;

    const markup_event&
    current() const {
      if (position == 0)
        throw std::logic_error("expat_reader: read() has not been called");
      return events[position - 1];
    }
  };

  expat_reader::expat_reader(std::string_view xml)
      : impl_(std::make_unique<impl>()) {
    parser_handle parser(XML_ParserCreate("UTF-8"), &XML_ParserFree);
    if (!parser) throw std::runtime_error("cannot create an expat parser");

    event_log log;
    log.parser = parser.get();
    XML_SetUserData(parser.get(), &log);
    XML_SetElementHandler(parser.get(), start_handler, end_handler);
    XML_SetCharacterDataHandler(parser.get(), text_handler);

    if (XML_Parse(parser.get(), xml.data(), static_cast<int>(xml.size()),
                  XML_TRUE) == XML_STATUS_ERROR) {
      throw std::runtime_error(
          "markup error at line " +
          std::to_string(XML_GetCurrentLineNumber(parser.get())) +
          ", column " +
          std::to_string(XML_GetCurrentColumnNumber(parser.get())) + ": " +
          XML_ErrorString(XML_GetErrorCode(parser.get())));
    }

    impl_->events = std::move(log.events);
  }

  expat_reader::~expat_reader() = default;
  expat_reader::expat_reader(expat_reader&&) noexcept = default;
  expat_reader&
  expat_reader::operator=(expat_reader&&) noexcept = default;

  bool
  expat_reader::read() {
    if (impl_->position == impl_->events.size()) return false;
    ++impl_->position;
    return true;
  }

  xml_node_type
  expat_reader::node_type() const {
    return impl_->current().type;
  }

  const std::string&
  expat_reader::name() const {
    return impl_->current().name;
  }

  std::size_t
  expat_reader::attribute_count() const {
    return impl_->current().attributes.size();
  }

  const std::string&
  expat_reader::attribute_name(std::size_t index) const {
    return impl_->current().attributes.at(index).first;
  }

  std::string_view
  expat_reader::attribute_value(std::size_t index) const {
    return impl_->current().attributes.at(index).second;
  }

  std::string_view
  expat_reader::text() const {
    return impl_->current().text;
  }

  std::size_t
  expat_reader::depth() const {
    return impl_->current().depth;
  }

  std::size_t
  expat_reader::line() const {
    return impl_->current().line;
  }

} // namespace sdoc
