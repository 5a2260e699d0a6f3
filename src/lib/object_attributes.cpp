#include <sdoc/object_attributes.hpp>

#include <stdexcept>
#include <utility>

namespace sdoc {

  // -- crop -----------------------------------------------------------------

  const attribute_list&
  crop::declared_attributes() {
    static const attribute_list attributes = {
        attribute_schema::optional("range", value_kind::string),
        attribute_schema::optional("feather", value_kind::string),
    };
    return attributes;
  }

  const entity_schema&
  crop::describe() {
    static const entity_schema schema = lineage_schema<crop>();
    return schema;
  }

  crop::crop(attribute_map values) : entity("Crop", describe(), std::move(values)) {}

  namespace {

    attribute_map
    crop_values(const crop_range& range, const std::optional<feather>& f) {
      attribute_map values;
      values.emplace("range", range.to_string());
      if (f) values.emplace("feather", f->to_string());
      return values;
    }

  } // namespace

  crop::crop(const crop_range& range, std::optional<sdoc::feather> feather)
      : crop(crop_values(range, feather)) {}

  // -- gradient_stop --------------------------------------------------------

  const attribute_list&
  gradient_stop::declared_attributes() {
    static const attribute_list attributes = {
        attribute_schema::optional("color", value_kind::string),
        attribute_schema::optional("position", value_kind::number),
    };
    return attributes;
  }

  const entity_schema&
  gradient_stop::describe() {
    static const entity_schema schema = lineage_schema<gradient_stop>();
    return schema;
  }

  gradient_stop::gradient_stop(attribute_map values)
      : entity("GradientStop", describe(), std::move(values)) {}

  namespace {

    attribute_map
    stop_values(const color& c, std::optional<double> position) {
      attribute_map values;
      values.emplace("color", c.to_string());
      values.emplace("position", position);
      return values;
    }

  } // namespace

  gradient_stop::gradient_stop(const color& c, std::optional<double> position)
      : gradient_stop(stop_values(c, position)) {}

  // -- brush ----------------------------------------------------------------

  std::string_view
  to_string(brush_type type) {
    switch (type) {
      case brush_type::solid:
        return "Solid";
      case brush_type::linear_gradient:
        return "LinearGradient";
      case brush_type::radial_gradient:
        return "RadialGradient";
      case brush_type::transparent:
        return "Transparent";
      case brush_type::bitmap:
        return "Bitmap";
    }
    throw std::invalid_argument("unknown brush type");
  }

  const attribute_list&
  brush::declared_attributes() {
    static const attribute_list attributes = {
        attribute_schema::optional("color", value_kind::string),
        attribute_schema::optional("type", value_kind::string),
        attribute_schema::optional("start_point", value_kind::string),
        attribute_schema::optional("end_point", value_kind::string),
        attribute_schema::optional("stops", value_kind::entity_list),
        attribute_schema::optional("bitmap", value_kind::entity),
    };
    return attributes;
  }

  const entity_schema&
  brush::describe() {
    static const entity_schema schema = lineage_schema<brush>();
    return schema;
  }

  brush::brush(attribute_map values)
      : entity("Brush", describe(), std::move(values)) {}

  brush::brush(brush_type type) : brush() {
    set("type", std::string(to_string(type)));
  }

  std::unique_ptr<brush>
  brush::solid(const color& c) {
    auto b = std::make_unique<brush>(brush_type::solid);
    b->set("color", c.to_string());
    return b;
  }

  std::unique_ptr<brush>
  brush::linear_gradient(entity_list stops, std::optional<std::string> start,
                         std::optional<std::string> end) {
    auto b = std::make_unique<brush>(brush_type::linear_gradient);
    b->set("stops", std::move(stops));
    b->set("start_point", std::move(start));
    b->set("end_point", std::move(end));
    return b;
  }

  std::unique_ptr<brush>
  brush::linear_gradient(const std::vector<std::pair<color, double>>& stops,
                         std::optional<std::string> start,
                         std::optional<std::string> end) {
    entity_list items;
    for (const auto& [c, position] : stops) {
      items.push_back(std::make_unique<gradient_stop>(c, position));
    }
    return linear_gradient(std::move(items), std::move(start), std::move(end));
  }

  gradient_stop&
  brush::add_stop(const color& c, std::optional<double> position) {
    auto& items = stops();
    items.push_back(std::make_unique<gradient_stop>(c, position));
    return static_cast<gradient_stop&>(*items.back());
  }

  // -- bitmap ---------------------------------------------------------------

  const attribute_list&
  bitmap::declared_attributes() {
    static const attribute_list attributes = {
        attribute_schema::required("source", value_kind::string),
    };
    return attributes;
  }

  const entity_schema&
  bitmap::describe() {
    static const entity_schema schema = lineage_schema<bitmap>();
    return schema;
  }

  bitmap::bitmap(attribute_map values)
      : entity("Bitmap", describe(), std::move(values)) {}

  namespace {

    attribute_map
    single(std::string name, attribute_value value) {
      attribute_map values;
      values.emplace(std::move(name), std::move(value));
      return values;
    }

  } // namespace

  bitmap::bitmap(std::string source)
      : bitmap(single("source", std::move(source))) {}

  // -- bounding -------------------------------------------------------------

  const attribute_list&
  bounding::declared_attributes() {
    static const attribute_list attributes = {
        attribute_schema::optional("object", value_kind::reference),
        attribute_schema::optional("padding", value_kind::string),
    };
    return attributes;
  }

  const entity_schema&
  bounding::describe() {
    static const entity_schema schema = lineage_schema<bounding>();
    return schema;
  }

  bounding::bounding(attribute_map values)
      : entity("Bounding", describe(), std::move(values)) {}

  namespace {

    attribute_map
    bounding_values(const entity& object, const std::optional<padding>& pad) {
      attribute_map values;
      values.emplace("object", reference(object));
      if (pad) values.emplace("padding", pad->to_string());
      return values;
    }

  } // namespace

  bounding::bounding(const entity& object, std::optional<sdoc::padding> pad)
      : bounding(bounding_values(object, pad)) {}

  // -- effect ---------------------------------------------------------------

  std::string_view
  to_string(effect_type type) {
    switch (type) {
      case effect_type::skew:
        return "Skew";
      case effect_type::shadow:
        return "Shadow";
      case effect_type::flip_x:
        return "FlipX";
      case effect_type::flip_y:
        return "FlipY";
    }
    throw std::invalid_argument("unknown effect type");
  }

  const attribute_list&
  effect::declared_attributes() {
    static const attribute_list attributes = {
        attribute_schema::required("type", value_kind::string),
        attribute_schema::optional("angle", value_kind::string),
        attribute_schema::optional("blur_amount", value_kind::integer),
        attribute_schema::optional("mode", value_kind::string),
    };
    return attributes;
  }

  const entity_schema&
  effect::describe() {
    static const entity_schema schema = lineage_schema<effect>();
    return schema;
  }

  effect::effect(attribute_map values)
      : entity("Effect", describe(), std::move(values)) {}

  effect::effect(effect_type type)
      : effect(single("type", std::string(to_string(type)))) {}

  std::unique_ptr<effect>
  effect::skew(int angle_x, int angle_y) {
    auto e = std::make_unique<effect>(effect_type::skew);
    e->set("angle", std::to_string(angle_x) + "," + std::to_string(angle_y));
    return e;
  }

  std::unique_ptr<effect>
  effect::shadow(int blur_amount, std::string mode) {
    auto e = std::make_unique<effect>(effect_type::shadow);
    e->set("blur_amount", blur_amount);
    e->set("mode", std::move(mode));
    return e;
  }

  std::unique_ptr<effect>
  effect::flip_x() {
    return std::make_unique<effect>(effect_type::flip_x);
  }

  std::unique_ptr<effect>
  effect::flip_y() {
    return std::make_unique<effect>(effect_type::flip_y);
  }

  // -- geometry -------------------------------------------------------------

  const attribute_list&
  geometry::declared_attributes() {
    static const attribute_list attributes = {
        attribute_schema::optional("type", value_kind::string),
    };
    return attributes;
  }

  const entity_schema&
  geometry::describe() {
    static const entity_schema schema = lineage_schema<geometry>();
    return schema;
  }

  geometry::geometry(attribute_map values)
      : entity("Geometry", describe(), std::move(values)) {}

  geometry::geometry(std::string type)
      : geometry(single("type", std::move(type))) {}

  // -- mask -----------------------------------------------------------------

  const attribute_list&
  mask::declared_attributes() {
    static const attribute_list attributes = {
        attribute_schema::optional("object", value_kind::reference),
    };
    return attributes;
  }

  const entity_schema&
  mask::describe() {
    static const entity_schema schema = lineage_schema<mask>();
    return schema;
  }

  mask::mask(attribute_map values)
      : entity("Mask", describe(), std::move(values)) {}

  mask::mask(const entity& object) : mask(single("object", reference(object))) {}

  // -- transform ------------------------------------------------------------

  const attribute_list&
  transform::declared_attributes() {
    static const attribute_list attributes = {
        attribute_schema::optional("rotate", value_kind::string),
    };
    return attributes;
  }

  const entity_schema&
  transform::describe() {
    static const entity_schema schema = lineage_schema<transform>();
    return schema;
  }

  transform::transform(attribute_map values)
      : entity("Transform", describe(), std::move(values)) {}

  transform::transform(const rotation& rotate)
      : transform(single("rotate", rotate.to_string())) {}

} // namespace sdoc
