#pragma once

#include <string>

namespace sdoc {

  class entity;

  // Late-bound, non-owning pointer to another entity's identity. The text
  // form is read from the target every time it is requested, so renaming the
  // target after the reference was taken is reflected in the output. The
  // target must outlive every serialization that renders this reference.
  class reference {
    const entity* target_;
    std::string key_;

  public:
    explicit reference(const entity& target, std::string key = "name")
        : target_(&target), key_(std::move(key)) {}

    const entity&
    target() const {
      return *target_;
    }

    const std::string&
    key() const {
      return key_;
    }

    // Throws unresolved_reference when the target has no value for key().
    std::string
    to_string() const;

    bool
    operator==(const reference&) const = default;
  };

} // namespace sdoc
