#pragma once

#include <sdoc/reference.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

namespace sdoc {

  class entity;

  enum class value_kind {
    absent,
    string,
    boolean,
    integer,
    number,
    entity,
    entity_list,
    reference,
  };

  std::string_view
  kind_name(value_kind kind);

  // True when a value of kind `actual` satisfies a schema that declares
  // `expected`. An integer satisfies number; absent satisfies anything.
  bool
  satisfies(value_kind expected, value_kind actual);

  // Values a schema entry may carry as its default. Entities and collections
  // are deliberately excluded so that no instance is ever shared between
  // entities.
  using scalar_value = std::variant<std::string, bool, std::int64_t, double>;

  using entity_list = std::vector<std::unique_ptr<entity>>;

  template <typename... Ts>
  entity_list
  make_entity_list(std::unique_ptr<Ts>... items) {
    entity_list list;
    list.reserve(sizeof...(Ts));
    (list.push_back(std::move(items)), ...);
    return list;
  }

  // Closed set of things an entity attribute can hold.
  class attribute_value {
  public:
    using storage = std::variant<std::monostate, std::string, bool,
                                 std::int64_t, double, std::unique_ptr<entity>,
                                 entity_list, reference>;

  private:
    storage data_;

  public:
    attribute_value();
    attribute_value(std::string value);
    attribute_value(const char* value);
    attribute_value(bool value);
    attribute_value(int value);
    attribute_value(std::int64_t value);
    attribute_value(double value);
    attribute_value(std::unique_ptr<entity> value);
    attribute_value(entity_list value);
    attribute_value(reference value);
    explicit attribute_value(const scalar_value& value);

    template <typename T, typename = std::enable_if_t<
                              std::is_base_of_v<entity, T> &&
                              !std::is_same_v<T, entity>>>
    attribute_value(std::unique_ptr<T> value)
        : attribute_value(std::unique_ptr<entity>(std::move(value))) {}

    template <typename T>
    attribute_value(std::optional<T> value) : attribute_value() {
      if (value) { *this = attribute_value(std::move(*value)); }
    }

    // Pointers would otherwise decay to bool.
    template <typename T>
    attribute_value(const T*) = delete;

    ~attribute_value();

    attribute_value(const attribute_value&) = delete;
    attribute_value&
    operator=(const attribute_value&) = delete;
    attribute_value(attribute_value&&) noexcept;
    attribute_value&
    operator=(attribute_value&&) noexcept;

    value_kind
    kind() const;

    bool
    is_absent() const {
      return std::holds_alternative<std::monostate>(data_);
    }

    const storage&
    data() const {
      return data_;
    }

    const std::string&
    as_string() const;

    bool
    as_bool() const;

    std::int64_t
    as_integer() const;

    // Accepts integer as well as number values.
    double
    as_number() const;

    const entity*
    as_entity() const;

    entity*
    as_entity();

    const entity_list&
    as_list() const;

    entity_list&
    as_list();

    const reference&
    as_reference() const;

    // Attribute text for scalar and reference values; "" when absent.
    // Entities and collections have no text form and throw.
    std::string
    to_string() const;
  };

} // namespace sdoc
