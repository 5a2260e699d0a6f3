#pragma once

#include <sdoc/color.hpp>
#include <sdoc/entity.hpp>
#include <sdoc/geometry.hpp>

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sdoc {

  // Value nodes attached to scene objects through wrapper elements
  // (<Rectangle.Fill><Brush .../></Rectangle.Fill>).

  class crop : public entity {
  public:
    using base_type = entity;

    static const attribute_list&
    declared_attributes();

    static const entity_schema&
    describe();

    explicit crop(attribute_map values = {});

    explicit crop(const crop_range& range,
                  std::optional<sdoc::feather> feather = std::nullopt);
  };

  class gradient_stop : public entity {
  public:
    using base_type = entity;

    static const attribute_list&
    declared_attributes();

    static const entity_schema&
    describe();

    explicit gradient_stop(attribute_map values = {});

    explicit gradient_stop(const color& c,
                           std::optional<double> position = std::nullopt);
  };

  enum class brush_type {
    solid,
    linear_gradient,
    radial_gradient,
    transparent,
    bitmap,
  };

  std::string_view
  to_string(brush_type type);

  class brush : public entity {
  public:
    using base_type = entity;

    static const attribute_list&
    declared_attributes();

    static const entity_schema&
    describe();

    explicit brush(attribute_map values = {});

    explicit brush(brush_type type);

    static std::unique_ptr<brush>
    solid(const color& c);

    // `start` and `end` are "x,y" points in the unit square.
    static std::unique_ptr<brush>
    linear_gradient(entity_list stops,
                    std::optional<std::string> start = std::nullopt,
                    std::optional<std::string> end = std::nullopt);

    static std::unique_ptr<brush>
    linear_gradient(const std::vector<std::pair<color, double>>& stops,
                    std::optional<std::string> start = std::nullopt,
                    std::optional<std::string> end = std::nullopt);

    entity_list&
    stops() {
      return list("stops");
    }

    gradient_stop&
    add_stop(const color& c, std::optional<double> position = std::nullopt);
  };

  class bitmap : public entity {
  public:
    using base_type = entity;

    static const attribute_list&
    declared_attributes();

    static const entity_schema&
    describe();

    explicit bitmap(attribute_map values);

    explicit bitmap(std::string source);
  };

  class bounding : public entity {
  public:
    using base_type = entity;

    static const attribute_list&
    declared_attributes();

    static const entity_schema&
    describe();

    explicit bounding(attribute_map values = {});

    // Fit the owner around `object` (by name) with `pad` around it.
    explicit bounding(const entity& object,
                      std::optional<sdoc::padding> pad = std::nullopt);
  };

  enum class effect_type { skew, shadow, flip_x, flip_y };

  std::string_view
  to_string(effect_type type);

  class effect : public entity {
  public:
    using base_type = entity;

    static const attribute_list&
    declared_attributes();

    static const entity_schema&
    describe();

    explicit effect(attribute_map values);

    explicit effect(effect_type type);

    static std::unique_ptr<effect>
    skew(int angle_x = 0, int angle_y = 0);

    static std::unique_ptr<effect>
    shadow(int blur_amount = 0, std::string mode = "Shadow");

    static std::unique_ptr<effect>
    flip_x();

    static std::unique_ptr<effect>
    flip_y();
  };

  class geometry : public entity {
  public:
    using base_type = entity;

    static const attribute_list&
    declared_attributes();

    static const entity_schema&
    describe();

    explicit geometry(attribute_map values = {});

    explicit geometry(std::string type);
  };

  class mask : public entity {
  public:
    using base_type = entity;

    static const attribute_list&
    declared_attributes();

    static const entity_schema&
    describe();

    explicit mask(attribute_map values = {});

    explicit mask(const entity& object);
  };

  class transform : public entity {
  public:
    using base_type = entity;

    static const attribute_list&
    declared_attributes();

    static const entity_schema&
    describe();

    explicit transform(attribute_map values = {});

    explicit transform(const rotation& rotate);
  };

} // namespace sdoc
