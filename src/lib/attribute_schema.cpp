#include <sdoc/attribute_schema.hpp>
#include <sdoc/error.hpp>

#include <algorithm>

namespace sdoc {

  const attribute_schema*
  entity_schema::find(std::string_view name) const {
    auto it = std::find_if(
        attributes_.begin(), attributes_.end(),
        [&](const attribute_schema& a) { return a.name() == name; });
    return it != attributes_.end() ? &*it : nullptr;
  }

  std::vector<std::string>
  entity_schema::names() const {
    std::vector<std::string> result;
    result.reserve(attributes_.size());
    for (const auto& a : attributes_)
      result.push_back(a.name());
    return result;
  }

  entity_schema
  merge_schema(const std::vector<const attribute_list*>& lineage,
               duplicate_policy policy) {
    entity_schema merged;
    for (const attribute_list* declared : lineage) {
      if (declared == nullptr) continue;
      for (const auto& a : *declared) {
        if (!merged.contains(a.name())) {
          merged.attributes_.push_back(a);
          continue;
        }
        if (policy == duplicate_policy::reject)
          throw duplicate_schema_name(a.name());
      }
    }
    return merged;
  }

} // namespace sdoc
