#include <sdoc/entity.hpp>
#include <sdoc/error.hpp>

#include <stdexcept>
#include <string>
#include <utility>

namespace sdoc {

  namespace {

    attribute_value
    resolve(const attribute_schema& a, attribute_map& supplied) {
      if (auto it = supplied.find(a.name()); it != supplied.end()) {
        attribute_value v = std::move(it->second);
        supplied.erase(it);
        if (!v.is_absent()) return v;
      }
      if (a.default_value()) return attribute_value(*a.default_value());
      if (a.expected_type() == value_kind::entity_list)
        return attribute_value(entity_list{});
      return {};
    }

  } // namespace

  entity::entity(std::string tag, const entity_schema& schema,
                 attribute_map values, entity_list children)
      : tag_(std::move(tag)), schema_(&schema) {
    for (const auto& a : schema_->attributes()) {
      attribute_value v = resolve(a, values);
      check(a, v);
      values_.emplace(a.name(), std::move(v));
    }

    // Whatever is left is outside the schema
    for (auto& [name, v] : values)
      values_.emplace(name, std::move(v));

    for (auto& child : children)
      append_child(std::move(child));
  }

  entity::~entity() = default;

  void
  entity::check(const attribute_schema& a, const attribute_value& value) const {
    if (value.is_absent()) {
      if (a.is_required()) throw missing_required_attribute(tag_, a.name());
      return;
    }
    if (a.expected_type() && !satisfies(*a.expected_type(), value.kind())) {
      throw type_mismatch(tag_, a.name(),
                          std::string(kind_name(*a.expected_type())),
                          std::string(kind_name(value.kind())));
    }
  }

  const attribute_value&
  entity::get(std::string_view name) const {
    static const attribute_value absent;
    auto it = values_.find(name);
    return it != values_.end() ? it->second : absent;
  }

  attribute_value*
  entity::find(std::string_view name) {
    auto it = values_.find(name);
    return it != values_.end() ? &it->second : nullptr;
  }

  void
  entity::set(std::string_view name, attribute_value value) {
    if (const auto* a = schema_->find(name)) check(*a, value);

    if (auto it = values_.find(name); it != values_.end()) {
      it->second = std::move(value);
    } else {
      values_.emplace(std::string(name), std::move(value));
    }
  }

  entity_list&
  entity::list(std::string_view name) {
    attribute_value* v = find(name);
    if (v == nullptr || v->is_absent()) {
      set(name, entity_list{});
      v = find(name);
    }
    if (v->kind() != value_kind::entity_list) {
      throw type_mismatch(tag_, std::string(name),
                          std::string(kind_name(value_kind::entity_list)),
                          std::string(kind_name(v->kind())));
    }
    return v->as_list();
  }

  entity&
  entity::append_child(std::unique_ptr<entity> child) {
    if (!child)
      throw std::invalid_argument("cannot append a null child to " + tag_);
    children_.push_back(std::move(child));
    return *children_.back();
  }

  std::vector<std::string>
  entity::declared_names() const {
    std::vector<std::string> names;
    for (const auto& a : schema_->attributes()) {
      if (!get(a.name()).is_absent()) names.push_back(a.name());
    }
    return names;
  }

} // namespace sdoc
