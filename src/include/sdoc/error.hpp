#pragma once

#include <stdexcept>
#include <string>

namespace sdoc {

  // A required schema attribute resolved to no value when an entity was built.
  class missing_required_attribute : public std::runtime_error {
    std::string tag_;
    std::string attribute_;

  public:
    missing_required_attribute(std::string tag, std::string attribute)
        : std::runtime_error(tag + " requires attribute '" + attribute + "'"),
          tag_(std::move(tag)), attribute_(std::move(attribute)) {}

    const std::string&
    tag() const {
      return tag_;
    }

    const std::string&
    attribute() const {
      return attribute_;
    }
  };

  // A value's kind disagrees with the kind its schema entry declares.
  class type_mismatch : public std::runtime_error {
    std::string tag_;
    std::string attribute_;

  public:
    type_mismatch(std::string tag, std::string attribute,
                  const std::string& expected, const std::string& received)
        : std::runtime_error(tag + "." + attribute + " requires a '" +
                             expected + "' but received a '" + received +
                             "'"),
          tag_(std::move(tag)), attribute_(std::move(attribute)) {}

    const std::string&
    tag() const {
      return tag_;
    }

    const std::string&
    attribute() const {
      return attribute_;
    }
  };

  // A reference's target has no text under the referenced key: the value is
  // absent, or it is an entity or collection.
  class unresolved_reference : public std::runtime_error {
    std::string tag_;
    std::string key_;

  public:
    unresolved_reference(std::string tag, std::string key,
                         const std::string& reason = "no value for")
        : std::runtime_error("reference to " +
                             (tag.empty() ? std::string("<null>") : tag) +
                             " cannot be resolved: " + reason + " '" + key +
                             "'"),
          tag_(std::move(tag)), key_(std::move(key)) {}

    const std::string&
    tag() const {
      return tag_;
    }

    const std::string&
    key() const {
      return key_;
    }
  };

  // Raised by merge_schema under duplicate_policy::reject.
  class duplicate_schema_name : public std::runtime_error {
    std::string attribute_;

  public:
    explicit duplicate_schema_name(std::string attribute)
        : std::runtime_error("attribute '" + attribute +
                             "' is already declared by an ancestor"),
          attribute_(std::move(attribute)) {}

    const std::string&
    attribute() const {
      return attribute_;
    }
  };

} // namespace sdoc
