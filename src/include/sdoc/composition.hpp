#pragma once

#include <sdoc/entity.hpp>
#include <sdoc/geometry.hpp>
#include <sdoc/object_attributes.hpp>

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace sdoc {

  class layer;

  // Root of a scene: a canvas of the given size holding layers.
  class composition : public entity {
  public:
    using base_type = entity;

    static const attribute_list&
    declared_attributes();

    static const entity_schema&
    describe();

    explicit composition(attribute_map values);

    composition(double width, double height);

    double
    width() const {
      return get("width").as_number();
    }

    double
    height() const {
      return get("height").as_number();
    }

    // Defaults: location 0,0,0 and the composition's own size.
    layer&
    add_layer(std::string name, std::optional<location> at = std::nullopt,
              std::optional<dimensions> size = std::nullopt);
  };

  class named_node : public entity {
  public:
    using base_type = entity;

    static const attribute_list&
    declared_attributes();

    const std::string&
    name() const {
      return get("name").as_string();
    }

    void
    rename(std::string name) {
      set("name", std::move(name));
    }

  protected:
    named_node(std::string tag, const entity_schema& schema,
               attribute_map values)
        : entity(std::move(tag), schema, std::move(values)) {}
  };

  enum class data_flags { hidden, show_visible, none };

  std::string_view
  to_string(data_flags flags);

  // A named object placed on a canvas.
  class object_node : public named_node {
  public:
    using base_type = named_node;

    static const attribute_list&
    declared_attributes();

    object_node&
    with_data_flags(data_flags flags);

  protected:
    object_node(std::string tag, const entity_schema& schema,
                attribute_map values)
        : named_node(std::move(tag), schema, std::move(values)) {}

    // Values map holding name, location and dimensions.
    static attribute_map
    placement(std::string name, const location& at, const dimensions& size);
  };

  class shape_node;
  class ellipse;
  class rectangle;
  class triangle;
  class right_triangle;
  class text_block;
  class image;
  class qr_code;
  class ticker;

  // A layer owns a nested composition of its own size; objects added to the
  // layer go into that composition.
  class layer : public object_node {
  public:
    using base_type = object_node;

    static const attribute_list&
    declared_attributes();

    static const entity_schema&
    describe();

    explicit layer(attribute_map values);

    layer(std::string name, const location& at, const dimensions& size,
          std::optional<bool> locked = std::nullopt);

    composition&
    content();

    const composition&
    content() const;

    template <typename T>
    T&
    append(std::unique_ptr<T> object) {
      return content().append_child(std::move(object));
    }

    ellipse&
    add_ellipse(std::string name, const location& at, const dimensions& size);

    rectangle&
    add_rectangle(std::string name, const location& at, const dimensions& size);

    triangle&
    add_triangle(std::string name, const location& at, const dimensions& size);

    right_triangle&
    add_right_triangle(std::string name, const location& at,
                       const dimensions& size);

    text_block&
    add_text_block(std::string name, std::string text, const location& at,
                   const dimensions& size);

    image&
    add_image(std::string name, std::string source, const location& at,
              const dimensions& size);

    qr_code&
    add_qr_code(std::string name, std::string text, const location& at,
                const dimensions& size);

    ticker&
    add_ticker(std::string name, const location& at, const dimensions& size);
  };

  // Common attributes of drawable shapes.
  class shape_node : public object_node {
  public:
    using base_type = object_node;

    static const attribute_list&
    declared_attributes();

    shape_node&
    with_fill(std::unique_ptr<brush> fill);

    shape_node&
    with_stroke(std::unique_ptr<brush> stroke,
                std::optional<double> thickness = std::nullopt);

    shape_node&
    with_opacity(double opacity);

    shape_node&
    with_transform(std::unique_ptr<transform> t);

    shape_node&
    with_crop(std::unique_ptr<crop> c);

    shape_node&
    add_effect(std::unique_ptr<effect> e);

  protected:
    using object_node::object_node;
  };

  class ellipse : public shape_node {
  public:
    using base_type = shape_node;

    static const attribute_list&
    declared_attributes();

    static const entity_schema&
    describe();

    explicit ellipse(attribute_map values);

    ellipse(std::string name, const location& at, const dimensions& size);
  };

  class triangle : public shape_node {
  public:
    using base_type = shape_node;

    static const attribute_list&
    declared_attributes();

    static const entity_schema&
    describe();

    explicit triangle(attribute_map values);

    triangle(std::string name, const location& at, const dimensions& size);
  };

  class right_triangle : public shape_node {
  public:
    using base_type = shape_node;

    static const attribute_list&
    declared_attributes();

    static const entity_schema&
    describe();

    explicit right_triangle(attribute_map values);

    right_triangle(std::string name, const location& at,
                   const dimensions& size);
  };

  class rectangle : public shape_node {
  public:
    using base_type = shape_node;

    static const attribute_list&
    declared_attributes();

    static const entity_schema&
    describe();

    explicit rectangle(attribute_map values);

    rectangle(std::string name, const location& at, const dimensions& size);

    rectangle&
    with_radius(double radius);

    rectangle&
    with_geometry(std::unique_ptr<geometry> g);

    rectangle&
    with_bounding(std::unique_ptr<bounding> b);

    // Grow the rectangle around `object` with an even padding.
    rectangle&
    bound_to(const entity& object, double pad);

    rectangle&
    with_mask(std::unique_ptr<mask> m);
  };

  // Optional typography of text objects. Unset members are left alone.
  struct text_style {
    std::optional<std::string> font_family;
    std::optional<double> font_size;
    std::optional<std::string> font_weight;
    std::optional<std::string> text_align;
    std::optional<std::string> vertical_align;
    std::optional<std::string> text_word_wrapping;
    std::optional<std::string> auto_size;
  };

  class text_block : public shape_node {
  public:
    using base_type = shape_node;

    static const attribute_list&
    declared_attributes();

    static const entity_schema&
    describe();

    explicit text_block(attribute_map values);

    text_block(std::string name, std::string text, const location& at,
               const dimensions& size);

    text_block&
    with_style(const text_style& style);

    text_block&
    with_mask(std::unique_ptr<mask> m);
  };

  class image : public object_node {
  public:
    using base_type = object_node;

    static const attribute_list&
    declared_attributes();

    static const entity_schema&
    describe();

    explicit image(attribute_map values);

    image(std::string name, std::string source, const location& at,
          const dimensions& size);
  };

  class qr_code : public object_node {
  public:
    using base_type = object_node;

    static const attribute_list&
    declared_attributes();

    static const entity_schema&
    describe();

    explicit qr_code(attribute_map values);

    qr_code(std::string name, std::string text, const location& at,
            const dimensions& size);
  };

  class ticker : public object_node {
  public:
    using base_type = object_node;

    static const attribute_list&
    declared_attributes();

    static const entity_schema&
    describe();

    explicit ticker(attribute_map values);

    ticker(std::string name, const location& at, const dimensions& size);

    ticker&
    with_style(const text_style& style);
  };

} // namespace sdoc
