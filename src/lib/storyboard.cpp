#include <sdoc/storyboard.hpp>

#include <stdexcept>
#include <utility>

namespace sdoc {

  namespace {

    template <typename Enum>
    std::optional<std::string>
    text_of(const std::optional<Enum>& value) {
      if (!value) return std::nullopt;
      return std::string(to_string(*value));
    }

    attribute_map
    animation_values(const entity& target, const animation_timing& timing) {
      attribute_map values;
      values.emplace("object", reference(target));
      values.emplace("duration", timing.duration);
      values.emplace("speed", timing.speed);
      values.emplace("delay", timing.delay);
      values.emplace("interpolation", text_of(timing.interpolation));
      values.emplace("direction", text_of(timing.direction));
      values.emplace("reverse", timing.reverse);
      values.emplace("center_axis", text_of(timing.center_axis));
      return values;
    }

  } // namespace

  std::string_view
  to_string(animation_kind kind) {
    switch (kind) {
      case animation_kind::bounce:
        return "Bounce";
      case animation_kind::expand:
        return "Expand";
      case animation_kind::fade:
        return "Fade";
      case animation_kind::fill_offset:
        return "FillOffset";
      case animation_kind::fly:
        return "Fly";
      case animation_kind::hidden:
        return "Hidden";
      case animation_kind::image_sequence_loop:
        return "ImageSequenceLoop";
      case animation_kind::none:
        return "None";
      case animation_kind::reveal:
        return "Reveal";
      case animation_kind::rotate:
        return "Rotate";
      case animation_kind::rotate_continuous:
        return "RotateContinuous";
      case animation_kind::stroke_offset:
        return "StrokeOffset";
      case animation_kind::zoom:
        return "Zoom";
      case animation_kind::zoom_fade:
        return "ZoomFade";
    }
    throw std::invalid_argument("unknown animation kind");
  }

  std::string_view
  to_string(interpolation value) {
    switch (value) {
      case interpolation::linear:
        return "Linear";
      case interpolation::cubic_easing_in:
        return "CubicEasingIn";
      case interpolation::cubic_easing_out:
        return "CubicEasingOut";
      case interpolation::cubic_easing_in_out:
        return "CubicEasingInOut";
      case interpolation::bounce_in:
        return "BounceIn";
      case interpolation::bounce_out:
        return "BounceOut";
    }
    throw std::invalid_argument("unknown interpolation");
  }

  std::string_view
  to_string(direction value) {
    switch (value) {
      case direction::top:
        return "Top";
      case direction::down:
        return "Down";
      case direction::left:
        return "Left";
      case direction::right:
        return "Right";
    }
    throw std::invalid_argument("unknown direction");
  }

  std::string_view
  to_string(center_axis value) {
    switch (value) {
      case center_axis::x:
        return "X";
      case center_axis::y:
        return "Y";
    }
    throw std::invalid_argument("unknown center axis");
  }

  // -- animation ------------------------------------------------------------

  const attribute_list&
  animation::declared_attributes() {
    static const attribute_list attributes = {
        attribute_schema::required("object", value_kind::reference),
        attribute_schema::optional("duration", value_kind::number),
        attribute_schema::optional("speed", value_kind::number),
        attribute_schema::optional("delay", value_kind::number),
        attribute_schema::optional("interpolation", value_kind::string),
        attribute_schema::optional("direction", value_kind::string),
        attribute_schema::optional("reverse", value_kind::boolean),
        attribute_schema::optional("center_axis", value_kind::string),
    };
    return attributes;
  }

  const entity_schema&
  animation::describe() {
    static const entity_schema schema = lineage_schema<animation>();
    return schema;
  }

  animation::animation(std::string tag, attribute_map values)
      : entity(std::move(tag), describe(), std::move(values)) {}

  animation::animation(animation_kind kind, const entity& target,
                       const animation_timing& timing)
      : animation(std::string(to_string(kind)),
                  animation_values(target, timing)) {}

  // -- storyboard -----------------------------------------------------------

  const attribute_list&
  storyboard::declared_attributes() {
    static const attribute_list attributes = {
        attribute_schema::optional("animations", value_kind::entity_list),
        attribute_schema::optional("data_name", value_kind::string),
        attribute_schema::required("type", value_kind::string),
        attribute_schema::optional("name", value_kind::string),
    };
    return attributes;
  }

  const entity_schema&
  storyboard::describe() {
    static const entity_schema schema = lineage_schema<storyboard>();
    return schema;
  }

  storyboard::storyboard(attribute_map values)
      : entity("Storyboard", describe(), std::move(values)) {}

  storyboard::storyboard(std::string type,
                         std::optional<std::string> data_name)
      : storyboard([&] {
          attribute_map values;
          values.emplace("type", std::move(type));
          values.emplace("data_name", std::move(data_name));
          return values;
        }()) {}

  std::unique_ptr<storyboard>
  storyboard::page(int number) {
    return std::make_unique<storyboard>("Page " + std::to_string(number));
  }

  std::unique_ptr<storyboard>
  storyboard::continuous() {
    return std::make_unique<storyboard>("Continuous");
  }

  std::unique_ptr<storyboard>
  storyboard::transition_in() {
    return std::make_unique<storyboard>("TransitionIn");
  }

  std::unique_ptr<storyboard>
  storyboard::transition_out() {
    return std::make_unique<storyboard>("TransitionOut");
  }

  std::unique_ptr<storyboard>
  storyboard::data_change_in(std::string data_name) {
    return std::make_unique<storyboard>("DataChangeIn", std::move(data_name));
  }

  std::unique_ptr<storyboard>
  storyboard::data_change_out(std::string data_name) {
    return std::make_unique<storyboard>("DataChangeOut", std::move(data_name));
  }

  animation&
  storyboard::append(std::unique_ptr<animation> a) {
    if (!a) throw std::invalid_argument("cannot append a null animation");
    animation& added = *a;
    list("animations").push_back(std::move(a));
    return added;
  }

  animation&
  storyboard::add(animation_kind kind, const entity& target,
                  const animation_timing& timing) {
    return append(std::make_unique<animation>(kind, target, timing));
  }

} // namespace sdoc
