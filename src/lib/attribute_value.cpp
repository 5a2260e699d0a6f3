#include <sdoc/attribute_value.hpp>
#include <sdoc/entity.hpp>
#include <sdoc/value_format.hpp>

#include <stdexcept>

namespace sdoc {

  std::string_view
  kind_name(value_kind kind) {
    switch (kind) {
      case value_kind::absent:
        return "absent";
      case value_kind::string:
        return "string";
      case value_kind::boolean:
        return "boolean";
      case value_kind::integer:
        return "integer";
      case value_kind::number:
        return "number";
      case value_kind::entity:
        return "entity";
      case value_kind::entity_list:
        return "entity list";
      case value_kind::reference:
        return "reference";
    }
    return "unknown";
  }

  bool
  satisfies(value_kind expected, value_kind actual) {
    if (actual == value_kind::absent || expected == actual) return true;
    return expected == value_kind::number && actual == value_kind::integer;
  }

  attribute_value::attribute_value() = default;

  attribute_value::attribute_value(std::string value)
      : data_(std::move(value)) {}

  attribute_value::attribute_value(const char* value)
      : data_(std::string(value)) {}

  attribute_value::attribute_value(bool value) : data_(value) {}

  attribute_value::attribute_value(int value)
      : data_(static_cast<std::int64_t>(value)) {}

  attribute_value::attribute_value(std::int64_t value) : data_(value) {}

  attribute_value::attribute_value(double value) : data_(value) {}

  attribute_value::attribute_value(std::unique_ptr<entity> value) {
    if (value) data_ = std::move(value);
  }

  attribute_value::attribute_value(entity_list value)
      : data_(std::move(value)) {}

  attribute_value::attribute_value(reference value) : data_(std::move(value)) {}

  attribute_value::attribute_value(const scalar_value& value) {
    std::visit([this](const auto& v) { data_ = v; }, value);
  }

  attribute_value::~attribute_value() = default;
  attribute_value::attribute_value(attribute_value&&) noexcept = default;
  attribute_value&
  attribute_value::operator=(attribute_value&&) noexcept = default;

  value_kind
  attribute_value::kind() const {
    switch (data_.index()) {
      case 0:
        return value_kind::absent;
      case 1:
        return value_kind::string;
      case 2:
        return value_kind::boolean;
      case 3:
        return value_kind::integer;
      case 4:
        return value_kind::number;
      case 5:
        return value_kind::entity;
      case 6:
        return value_kind::entity_list;
      default:
        return value_kind::reference;
    }
  }

  const std::string&
  attribute_value::as_string() const {
    return std::get<std::string>(data_);
  }

  bool
  attribute_value::as_bool() const {
    return std::get<bool>(data_);
  }

  std::int64_t
  attribute_value::as_integer() const {
    return std::get<std::int64_t>(data_);
  }

  double
  attribute_value::as_number() const {
    if (const auto* i = std::get_if<std::int64_t>(&data_))
      return static_cast<double>(*i);
    return std::get<double>(data_);
  }

  const entity*
  attribute_value::as_entity() const {
    return std::get<std::unique_ptr<entity>>(data_).get();
  }

  entity*
  attribute_value::as_entity() {
    return std::get<std::unique_ptr<entity>>(data_).get();
  }

  const entity_list&
  attribute_value::as_list() const {
    return std::get<entity_list>(data_);
  }

  entity_list&
  attribute_value::as_list() {
    return std::get<entity_list>(data_);
  }

  const reference&
  attribute_value::as_reference() const {
    return std::get<reference>(data_);
  }

  std::string
  attribute_value::to_string() const {
    switch (kind()) {
      case value_kind::absent:
        return {};
      case value_kind::string:
        return as_string();
      case value_kind::boolean:
        return format(as_bool());
      case value_kind::integer:
        return format(as_integer());
      case value_kind::number:
        return format(std::get<double>(data_));
      case value_kind::reference:
        return as_reference().to_string();
      case value_kind::entity:
      case value_kind::entity_list:
        break;
    }
    throw std::logic_error(std::string(kind_name(kind())) +
                           " values have no attribute text");
  }

} // namespace sdoc
