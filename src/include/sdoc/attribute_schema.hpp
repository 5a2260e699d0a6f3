#pragma once

#include <sdoc/attribute_value.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace sdoc {

  // Immutable description of one serializable entity attribute.
  class attribute_schema {
    std::string name_;
    std::optional<value_kind> expected_type_;
    std::optional<scalar_value> default_value_;
    bool required_ = false;
    bool omit_if_absent_ = true;

  public:
    explicit attribute_schema(
        std::string name, std::optional<value_kind> expected_type = std::nullopt,
        std::optional<scalar_value> default_value = std::nullopt,
        bool required = false, bool omit_if_absent = true)
        : name_(std::move(name)), expected_type_(expected_type),
          default_value_(std::move(default_value)), required_(required),
          omit_if_absent_(omit_if_absent) {}

    static attribute_schema
    required(std::string name,
             std::optional<value_kind> expected_type = std::nullopt) {
      return attribute_schema(std::move(name), expected_type, std::nullopt,
                              true);
    }

    static attribute_schema
    optional(std::string name,
             std::optional<value_kind> expected_type = std::nullopt,
             std::optional<scalar_value> default_value = std::nullopt) {
      return attribute_schema(std::move(name), expected_type,
                              std::move(default_value), false);
    }

    const std::string&
    name() const {
      return name_;
    }

    const std::optional<value_kind>&
    expected_type() const {
      return expected_type_;
    }

    const std::optional<scalar_value>&
    default_value() const {
      return default_value_;
    }

    bool
    is_required() const {
      return required_;
    }

    bool
    omit_if_absent() const {
      return omit_if_absent_;
    }

    // Structural: every field takes part. Schema merge identifies entries
    // by name() alone.
    bool
    operator==(const attribute_schema&) const = default;
  };

  using attribute_list = std::vector<attribute_schema>;

  enum class duplicate_policy {
    // A redeclared name keeps the position and definition of its first
    // declaration; the later one is dropped.
    keep_first,
    // A redeclared name is an error (duplicate_schema_name).
    reject,
  };

  // Merged, ordered attribute list of one entity type. Names are unique.
  class entity_schema {
    attribute_list attributes_;

  public:
    entity_schema() = default;

    const attribute_list&
    attributes() const {
      return attributes_;
    }

    std::size_t
    size() const {
      return attributes_.size();
    }

    const attribute_schema*
    find(std::string_view name) const;

    bool
    contains(std::string_view name) const {
      return find(name) != nullptr;
    }

    std::vector<std::string>
    names() const;

    friend entity_schema
    merge_schema(const std::vector<const attribute_list*>& lineage,
                 duplicate_policy policy);
  };

  // Concatenate the declared attribute lists of a type lineage, root-most
  // ancestor first and the type's own declarations last, skipping every name
  // that already appeared earlier.
  entity_schema
  merge_schema(const std::vector<const attribute_list*>& lineage,
               duplicate_policy policy = duplicate_policy::keep_first);

  class entity;

  namespace detail {

    template <typename T>
    void
    collect_lineage(std::vector<const attribute_list*>& lineage) {
      if constexpr (!std::is_same_v<typename T::base_type, entity>) {
        collect_lineage<typename T::base_type>(lineage);
      }
      lineage.push_back(&T::declared_attributes());
    }

  } // namespace detail

  // Merged schema of entity type T. T names its parent entity type as
  // `base_type` and its own attributes through `declared_attributes()`; the
  // walk stops at the generic entity base.
  template <typename T>
  entity_schema
  lineage_schema(duplicate_policy policy = duplicate_policy::keep_first) {
    std::vector<const attribute_list*> lineage;
    detail::collect_lineage<T>(lineage);
    return merge_schema(lineage, policy);
  }

} // namespace sdoc
