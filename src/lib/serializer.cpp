#include <sdoc/naming.hpp>
#include <sdoc/serializer.hpp>

#include <stdexcept>
#include <string>

namespace sdoc {

  namespace {

    void
    serialize_into(const entity& e, element& out);

    element
    serialize_entity(const entity& e) {
      element out(e.tag());
      serialize_into(e, out);
      return out;
    }

    const entity&
    checked(const std::unique_ptr<entity>& item, const entity& owner,
            const std::string& attribute) {
      if (!item)
        throw std::invalid_argument(owner.tag() + "." + attribute +
                                    " holds a null entity");
      return *item;
    }

    void
    serialize_into(const entity& e, element& out) {
      for (const auto& a : e.schema().attributes()) {
        const attribute_value& value = e.get(a.name());
        if (value.is_absent() && a.omit_if_absent()) continue;

        std::string external_name = to_pascal_case(a.name());

        switch (value.kind()) {
          case value_kind::entity: {
            element wrapper(e.tag() + "." + external_name);
            wrapper.append(serialize_entity(*value.as_entity()));
            out.append(std::move(wrapper));
            break;
          }
          case value_kind::entity_list: {
            const entity_list& items = value.as_list();
            if (items.empty()) break;
            element wrapper(e.tag() + "." + external_name);
            for (const auto& item : items) {
              wrapper.append(serialize_entity(checked(item, e, a.name())));
            }
            out.append(std::move(wrapper));
            break;
          }
          default:
            out.set_attribute(std::move(external_name), value.to_string());
            break;
        }
      }

      for (const auto& child : e.children()) {
        out.append(serialize_entity(*child));
      }
    }

  } // namespace

  element
  serialize(const entity& root) {
    return serialize_entity(root);
  }

  element&
  serialize(const entity& e, element& parent) {
    return parent.append(serialize_entity(e));
  }

} // namespace sdoc
