#pragma once

#include <sdoc/attribute_schema.hpp>
#include <sdoc/attribute_value.hpp>

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace sdoc {

  using attribute_map = std::map<std::string, attribute_value, std::less<>>;

  // Generic document node: a tag, the merged schema of its type, attribute
  // values keyed by schema name, and structural children. Entities are
  // neither copyable nor movable so that references to them stay valid; hold
  // them through std::unique_ptr or in place.
  class entity {
    std::string tag_;
    const entity_schema* schema_;
    attribute_map values_;
    entity_list children_;

  public:
    // Resolves every schema entry from `values` or its default. Collection
    // attributes without a value receive their own empty collection.
    // Throws missing_required_attribute or type_mismatch; no entity exists
    // afterwards in that case. Names outside the schema are kept but never
    // serialized.
    entity(std::string tag, const entity_schema& schema,
           attribute_map values = {}, entity_list children = {});

    virtual ~entity();

    entity(const entity&) = delete;
    entity&
    operator=(const entity&) = delete;
    entity(entity&&) = delete;
    entity&
    operator=(entity&&) = delete;

    const std::string&
    tag() const {
      return tag_;
    }

    const entity_schema&
    schema() const {
      return *schema_;
    }

    // The stored value, or an absent value for unknown names.
    const attribute_value&
    get(std::string_view name) const;

    attribute_value*
    find(std::string_view name);

    // Schema-declared names are checked like construction: the kind must
    // match and required attributes cannot be cleared.
    void
    set(std::string_view name, attribute_value value);

    // The collection held by `name`, created empty when absent.
    entity_list&
    list(std::string_view name);

    entity&
    append_child(std::unique_ptr<entity> child);

    template <typename T>
    T&
    append_child(std::unique_ptr<T> child) {
      T& added = *child;
      append_child(std::unique_ptr<entity>(std::move(child)));
      return added;
    }

    const entity_list&
    children() const {
      return children_;
    }

    // Schema names, in schema order, whose value is not absent.
    std::vector<std::string>
    declared_names() const;

  private:
    void
    check(const attribute_schema& a, const attribute_value& value) const;
  };

} // namespace sdoc
