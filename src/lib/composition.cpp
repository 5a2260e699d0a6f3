#include <sdoc/composition.hpp>

#include <stdexcept>
#include <utility>

namespace sdoc {

  namespace {

    attribute_map
    size_values(double width, double height) {
      attribute_map values;
      values.emplace("width", width);
      values.emplace("height", height);
      return values;
    }

    attribute_map
    with(attribute_map values, std::string name, attribute_value value) {
      values.insert_or_assign(std::move(name), std::move(value));
      return values;
    }

    void
    apply_style(entity& e, const text_style& style) {
      auto put = [&e](std::string_view name, const auto& value) {
        if (value && e.schema().contains(name)) e.set(name, *value);
      };
      put("font_family", style.font_family);
      put("font_size", style.font_size);
      put("font_weight", style.font_weight);
      put("text_align", style.text_align);
      put("vertical_align", style.vertical_align);
      put("text_word_wrapping", style.text_word_wrapping);
      put("auto_size", style.auto_size);
    }

  } // namespace

  // -- composition ----------------------------------------------------------

  const attribute_list&
  composition::declared_attributes() {
    static const attribute_list attributes = {
        attribute_schema::required("width", value_kind::number),
        attribute_schema::required("height", value_kind::number),
    };
    return attributes;
  }

  const entity_schema&
  composition::describe() {
    static const entity_schema schema = lineage_schema<composition>();
    return schema;
  }

  composition::composition(attribute_map values)
      : entity("Composition", describe(), std::move(values)) {}

  composition::composition(double width, double height)
      : composition(size_values(width, height)) {}

  layer&
  composition::add_layer(std::string name, std::optional<location> at,
                         std::optional<dimensions> size) {
    return append_child(std::make_unique<layer>(
        std::move(name), at.value_or(location{}),
        size.value_or(dimensions(width(), height()))));
  }

  // -- named_node / object_node ---------------------------------------------

  const attribute_list&
  named_node::declared_attributes() {
    static const attribute_list attributes = {
        attribute_schema::required("name", value_kind::string),
    };
    return attributes;
  }

  std::string_view
  to_string(data_flags flags) {
    switch (flags) {
      case data_flags::hidden:
        return "Hidden";
      case data_flags::show_visible:
        return "ShowVisible";
      case data_flags::none:
        return "None";
    }
    throw std::invalid_argument("unknown data flags");
  }

  const attribute_list&
  object_node::declared_attributes() {
    static const attribute_list attributes = {
        attribute_schema::required("location", value_kind::string),
        attribute_schema::required("dimensions", value_kind::string),
        attribute_schema::optional("data_flags", value_kind::string),
    };
    return attributes;
  }

  object_node&
  object_node::with_data_flags(data_flags flags) {
    set("data_flags", std::string(to_string(flags)));
    return *this;
  }

  attribute_map
  object_node::placement(std::string name, const location& at,
                         const dimensions& size) {
    attribute_map values;
    values.emplace("name", std::move(name));
    values.emplace("location", at.to_string());
    values.emplace("dimensions", size.to_string());
    return values;
  }

  // -- layer ----------------------------------------------------------------

  const attribute_list&
  layer::declared_attributes() {
    static const attribute_list attributes = {
        attribute_schema::optional("locked", value_kind::boolean),
        attribute_schema::optional("composition", value_kind::entity),
    };
    return attributes;
  }

  const entity_schema&
  layer::describe() {
    static const entity_schema schema = lineage_schema<layer>();
    return schema;
  }

  layer::layer(attribute_map values)
      : object_node("Layer", describe(), std::move(values)) {}

  layer::layer(std::string name, const location& at, const dimensions& size,
               std::optional<bool> locked)
      : layer(with(with(placement(std::move(name), at, size), "locked", locked),
                   "composition",
                   std::make_unique<composition>(size.width(),
                                                 size.height()))) {}

  composition&
  layer::content() {
    composition* nested = nullptr;
    if (attribute_value* value = find("composition");
        value != nullptr && value->kind() == value_kind::entity)
      nested = dynamic_cast<composition*>(value->as_entity());
    if (nested == nullptr)
      throw std::logic_error("layer '" + name() + "' has no composition");
    return *nested;
  }

  const composition&
  layer::content() const {
    return const_cast<layer*>(this)->content();
  }

  ellipse&
  layer::add_ellipse(std::string name, const location& at,
                     const dimensions& size) {
    return append(std::make_unique<ellipse>(std::move(name), at, size));
  }

  rectangle&
  layer::add_rectangle(std::string name, const location& at,
                       const dimensions& size) {
    return append(std::make_unique<rectangle>(std::move(name), at, size));
  }

  triangle&
  layer::add_triangle(std::string name, const location& at,
                      const dimensions& size) {
    return append(std::make_unique<triangle>(std::move(name), at, size));
  }

  right_triangle&
  layer::add_right_triangle(std::string name, const location& at,
                            const dimensions& size) {
    return append(std::make_unique<right_triangle>(std::move(name), at, size));
  }

  text_block&
  layer::add_text_block(std::string name, std::string text, const location& at,
                        const dimensions& size) {
    return append(std::make_unique<text_block>(std::move(name), std::move(text),
                                               at, size));
  }

  image&
  layer::add_image(std::string name, std::string source, const location& at,
                   const dimensions& size) {
    return append(
        std::make_unique<image>(std::move(name), std::move(source), at, size));
  }

  qr_code&
  layer::add_qr_code(std::string name, std::string text, const location& at,
                     const dimensions& size) {
    return append(
        std::make_unique<qr_code>(std::move(name), std::move(text), at, size));
  }

  ticker&
  layer::add_ticker(std::string name, const location& at,
                    const dimensions& size) {
    return append(std::make_unique<ticker>(std::move(name), at, size));
  }

  // -- shape_node -----------------------------------------------------------

  const attribute_list&
  shape_node::declared_attributes() {
    static const attribute_list attributes = {
        attribute_schema::optional("fill", value_kind::entity),
        attribute_schema::optional("stroke", value_kind::entity),
        attribute_schema::optional("stroke_thickness", value_kind::number),
        attribute_schema::optional("opacity", value_kind::number),
        attribute_schema::optional("transform", value_kind::entity),
        attribute_schema::optional("crop", value_kind::entity),
        attribute_schema::optional("effects", value_kind::entity_list),
    };
    return attributes;
  }

  shape_node&
  shape_node::with_fill(std::unique_ptr<brush> fill) {
    set("fill", std::move(fill));
    return *this;
  }

  shape_node&
  shape_node::with_stroke(std::unique_ptr<brush> stroke,
                          std::optional<double> thickness) {
    set("stroke", std::move(stroke));
    if (thickness) set("stroke_thickness", *thickness);
    return *this;
  }

  shape_node&
  shape_node::with_opacity(double opacity) {
    set("opacity", opacity);
    return *this;
  }

  shape_node&
  shape_node::with_transform(std::unique_ptr<transform> t) {
    set("transform", std::move(t));
    return *this;
  }

  shape_node&
  shape_node::with_crop(std::unique_ptr<crop> c) {
    set("crop", std::move(c));
    return *this;
  }

  shape_node&
  shape_node::add_effect(std::unique_ptr<effect> e) {
    if (!e) throw std::invalid_argument("cannot add a null effect");
    list("effects").push_back(std::move(e));
    return *this;
  }

  // -- ellipse / triangle / right_triangle ----------------------------------

  const attribute_list&
  ellipse::declared_attributes() {
    static const attribute_list attributes;
    return attributes;
  }

  const entity_schema&
  ellipse::describe() {
    static const entity_schema schema = lineage_schema<ellipse>();
    return schema;
  }

  ellipse::ellipse(attribute_map values)
      : shape_node("Ellipse", describe(), std::move(values)) {}

  ellipse::ellipse(std::string name, const location& at, const dimensions& size)
      : ellipse(placement(std::move(name), at, size)) {}

  const attribute_list&
  triangle::declared_attributes() {
    static const attribute_list attributes;
    return attributes;
  }

  const entity_schema&
  triangle::describe() {
    static const entity_schema schema = lineage_schema<triangle>();
    return schema;
  }

  triangle::triangle(attribute_map values)
      : shape_node("Triangle", describe(), std::move(values)) {}

  triangle::triangle(std::string name, const location& at,
                     const dimensions& size)
      : triangle(placement(std::move(name), at, size)) {}

  const attribute_list&
  right_triangle::declared_attributes() {
    static const attribute_list attributes;
    return attributes;
  }

  const entity_schema&
  right_triangle::describe() {
    static const entity_schema schema = lineage_schema<right_triangle>();
    return schema;
  }

  right_triangle::right_triangle(attribute_map values)
      : shape_node("RightTriangle", describe(), std::move(values)) {}

  right_triangle::right_triangle(std::string name, const location& at,
                                 const dimensions& size)
      : right_triangle(placement(std::move(name), at, size)) {}

  // -- rectangle ------------------------------------------------------------

  const attribute_list&
  rectangle::declared_attributes() {
    static const attribute_list attributes = {
        attribute_schema::optional("radius", value_kind::number),
        attribute_schema::optional("style", value_kind::string),
        attribute_schema::optional("visible", value_kind::boolean),
        attribute_schema::optional("geometry", value_kind::entity),
        attribute_schema::optional("bounding", value_kind::entity),
        attribute_schema::optional("mask", value_kind::entity),
    };
    return attributes;
  }

  const entity_schema&
  rectangle::describe() {
    static const entity_schema schema = lineage_schema<rectangle>();
    return schema;
  }

  rectangle::rectangle(attribute_map values)
      : shape_node("Rectangle", describe(), std::move(values)) {}

  rectangle::rectangle(std::string name, const location& at,
                       const dimensions& size)
      : rectangle(placement(std::move(name), at, size)) {}

  rectangle&
  rectangle::with_radius(double radius) {
    set("radius", radius);
    return *this;
  }

  rectangle&
  rectangle::with_geometry(std::unique_ptr<geometry> g) {
    set("geometry", std::move(g));
    return *this;
  }

  rectangle&
  rectangle::with_bounding(std::unique_ptr<bounding> b) {
    set("bounding", std::move(b));
    return *this;
  }

  rectangle&
  rectangle::bound_to(const entity& object, double pad) {
    return with_bounding(std::make_unique<bounding>(object, padding(pad)));
  }

  rectangle&
  rectangle::with_mask(std::unique_ptr<mask> m) {
    set("mask", std::move(m));
    return *this;
  }

  // -- text_block -----------------------------------------------------------

  const attribute_list&
  text_block::declared_attributes() {
    static const attribute_list attributes = {
        attribute_schema::required("text", value_kind::string),
        attribute_schema::optional("font_family", value_kind::string),
        attribute_schema::optional("font_size", value_kind::number),
        attribute_schema::optional("font_weight", value_kind::string),
        attribute_schema::optional("text_align", value_kind::string),
        attribute_schema::optional("vertical_align", value_kind::string),
        attribute_schema::optional("text_word_wrapping", value_kind::string),
        attribute_schema::optional("auto_size", value_kind::string),
        attribute_schema::optional("mask", value_kind::entity),
    };
    return attributes;
  }

  const entity_schema&
  text_block::describe() {
    static const entity_schema schema = lineage_schema<text_block>();
    return schema;
  }

  text_block::text_block(attribute_map values)
      : shape_node("TextBlock", describe(), std::move(values)) {}

  text_block::text_block(std::string name, std::string text, const location& at,
                         const dimensions& size)
      : text_block(
            with(placement(std::move(name), at, size), "text", std::move(text))) {}

  text_block&
  text_block::with_style(const text_style& style) {
    apply_style(*this, style);
    return *this;
  }

  text_block&
  text_block::with_mask(std::unique_ptr<mask> m) {
    set("mask", std::move(m));
    return *this;
  }

  // -- image ----------------------------------------------------------------

  const attribute_list&
  image::declared_attributes() {
    static const attribute_list attributes = {
        attribute_schema::optional("bitmap", value_kind::entity),
        attribute_schema::optional("geometry", value_kind::entity),
        attribute_schema::optional("opacity", value_kind::number),
        attribute_schema::optional("size_mode", value_kind::string),
        attribute_schema::optional("transform", value_kind::entity),
        attribute_schema::optional("visible", value_kind::boolean),
        attribute_schema::optional("effects", value_kind::entity_list),
    };
    return attributes;
  }

  const entity_schema&
  image::describe() {
    static const entity_schema schema = lineage_schema<image>();
    return schema;
  }

  image::image(attribute_map values)
      : object_node("Image", describe(), std::move(values)) {}

  image::image(std::string name, std::string source, const location& at,
               const dimensions& size)
      : image(with(placement(std::move(name), at, size), "bitmap",
                   std::make_unique<bitmap>(std::move(source)))) {}

  // -- qr_code --------------------------------------------------------------

  const attribute_list&
  qr_code::declared_attributes() {
    static const attribute_list attributes = {
        attribute_schema::required("text", value_kind::string),
    };
    return attributes;
  }

  const entity_schema&
  qr_code::describe() {
    static const entity_schema schema = lineage_schema<qr_code>();
    return schema;
  }

  qr_code::qr_code(attribute_map values)
      : object_node("QRCode", describe(), std::move(values)) {}

  qr_code::qr_code(std::string name, std::string text, const location& at,
                   const dimensions& size)
      : qr_code(
            with(placement(std::move(name), at, size), "text", std::move(text))) {}

  // -- ticker ---------------------------------------------------------------

  const attribute_list&
  ticker::declared_attributes() {
    static const attribute_list attributes = {
        attribute_schema::optional("fill", value_kind::entity),
        attribute_schema::optional("stroke", value_kind::entity),
        attribute_schema::optional("font_family", value_kind::string),
        attribute_schema::optional("font_size", value_kind::number),
        attribute_schema::optional("font_weight", value_kind::string),
        attribute_schema::optional("text_align", value_kind::string),
        attribute_schema::optional("vertical_align", value_kind::string),
        attribute_schema::optional("text_word_wrapping", value_kind::string),
        attribute_schema::optional("speed", value_kind::number),
        attribute_schema::optional("direction", value_kind::string),
        attribute_schema::optional("type", value_kind::string),
    };
    return attributes;
  }

  const entity_schema&
  ticker::describe() {
    static const entity_schema schema = lineage_schema<ticker>();
    return schema;
  }

  ticker::ticker(attribute_map values)
      : object_node("Ticker", describe(), std::move(values)) {}

  ticker::ticker(std::string name, const location& at, const dimensions& size)
      : ticker(placement(std::move(name), at, size)) {}

  ticker&
  ticker::with_style(const text_style& style) {
    apply_style(*this, style);
    return *this;
  }

} // namespace sdoc
