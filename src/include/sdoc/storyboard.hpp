#pragma once

#include <sdoc/entity.hpp>

#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace sdoc {

  enum class animation_kind {
    bounce,
    expand,
    fade,
    fill_offset,
    fly,
    hidden,
    image_sequence_loop,
    none,
    reveal,
    rotate,
    rotate_continuous,
    stroke_offset,
    zoom,
    zoom_fade,
  };

  // Element tag of an animation kind ("FillOffset", "ZoomFade", ...).
  std::string_view
  to_string(animation_kind kind);

  enum class interpolation {
    linear,
    cubic_easing_in,
    cubic_easing_out,
    cubic_easing_in_out,
    bounce_in,
    bounce_out,
  };

  std::string_view
  to_string(interpolation value);

  enum class direction { top, down, left, right };

  std::string_view
  to_string(direction value);

  enum class center_axis { x, y };

  std::string_view
  to_string(center_axis value);

  // Timing and motion options of one animation; unset members are omitted.
  struct animation_timing {
    std::optional<double> duration;
    std::optional<double> delay;
    std::optional<double> speed;
    std::optional<sdoc::interpolation> interpolation;
    std::optional<sdoc::direction> direction;
    std::optional<sdoc::center_axis> center_axis;
    std::optional<bool> reverse;
  };

  // An animation of one scene object. All kinds share one schema; the kind
  // only selects the element tag. The object is linked by reference and
  // its name is read when the animation is serialized.
  class animation : public entity {
  public:
    using base_type = entity;

    static const attribute_list&
    declared_attributes();

    static const entity_schema&
    describe();

    animation(std::string tag, attribute_map values);

    animation(animation_kind kind, const entity& target,
              const animation_timing& timing = {});
  };

  class storyboard : public entity {
  public:
    using base_type = entity;

    static const attribute_list&
    declared_attributes();

    static const entity_schema&
    describe();

    explicit storyboard(attribute_map values);

    explicit storyboard(std::string type,
                        std::optional<std::string> data_name = std::nullopt);

    static std::unique_ptr<storyboard>
    page(int number);

    static std::unique_ptr<storyboard>
    continuous();

    static std::unique_ptr<storyboard>
    transition_in();

    static std::unique_ptr<storyboard>
    transition_out();

    // `data_name` has the form "Object_Name.Attribute".
    static std::unique_ptr<storyboard>
    data_change_in(std::string data_name);

    static std::unique_ptr<storyboard>
    data_change_out(std::string data_name);

    const std::string&
    type() const {
      return get("type").as_string();
    }

    const entity_list&
    animations() const {
      return get("animations").as_list();
    }

    animation&
    append(std::unique_ptr<animation> a);

    animation&
    add(animation_kind kind, const entity& target,
        const animation_timing& timing = {});
  };

} // namespace sdoc
