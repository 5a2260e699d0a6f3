#include <sdoc/entity.hpp>
#include <sdoc/error.hpp>
#include <sdoc/reference.hpp>

#include <string>

namespace sdoc {

  std::string
  reference::to_string() const {
    // Read on every call; the target may have been renamed since.
    const attribute_value& value = target_->get(key_);
    switch (value.kind()) {
      case value_kind::absent:
        throw unresolved_reference(target_->tag(), key_);
      case value_kind::entity:
      case value_kind::entity_list:
        throw unresolved_reference(target_->tag(), key_,
                                   "no text (" +
                                       std::string(kind_name(value.kind())) +
                                       ") under");
      default:
        return value.to_string();
    }
  }

} // namespace sdoc
