#include <sdoc/color.hpp>
#include <sdoc/sample.hpp>
#include <sdoc/value_format.hpp>

#include <stdexcept>
#include <string>

namespace sdoc {

  namespace {

    constexpr double margin_size = 60;
    constexpr double line_height = 100;
    constexpr double frame_padding = 15;
    constexpr double text_inset = 16;

    const char* const lorem =
        "Lorem ipsum dolor sit amet consectetur adipisicing elit. "
        "Voluptatum facilis nobis earum eos ipsa consectetur incidunt "
        "vitae beatae soluta nihil doloremque, est esse debitis.";

  } // namespace

  project
  make_sample_project(double width, double height) {
    const color white = color::from_hex("#E7E7ED");
    const color black = color::from_hex("#232325");
    const color red = color::from_hex("#FF2300");

    // Both bands must have room for their text and must not overlap.
    const double inner_width = width - 2 * margin_size;
    const double body_top = height - margin_size - line_height;
    if (!(inner_width - 2 * text_inset > 0))
      throw std::invalid_argument(
          "sample canvas width must exceed " +
          format(2 * (margin_size + text_inset)) + ": " + format(width));
    if (!(body_top >= margin_size + line_height))
      throw std::invalid_argument(
          "sample canvas height must be at least " +
          format(2 * (margin_size + line_height)) + ": " + format(height));

    project proj(width, height);

    text_style heading;
    heading.font_family = "Century Gothic";
    heading.font_size = 90;
    heading.font_weight = "Bold";
    heading.auto_size = "WidthAndHeight";

    auto& layer1 = proj.add_layer("Layer 1");
    auto& rect1 = layer1.add_rectangle(
        "Rect 1", location{margin_size, margin_size},
        dimensions(inner_width, line_height));
    rect1.with_fill(brush::solid(red));
    auto& text1 = layer1.add_text_block(
        "Text 1", "HERE WE ARE", location{margin_size, margin_size},
        dimensions(inner_width, line_height));
    text1.with_style(heading).with_fill(brush::solid(white));
    rect1.bound_to(text1, frame_padding);

    text_style body;
    body.font_family = "Century Gothic";
    body.font_size = 30;

    auto& layer2 = proj.add_layer("Layer 2");
    auto& rect2 = layer2.add_rectangle(
        "Rect 2", location{margin_size, body_top},
        dimensions(inner_width, line_height));
    rect2.with_fill(brush::solid(white.with_alpha(0.8)));
    auto& text2 = layer2.add_text_block(
        "Text2", lorem, location{margin_size + text_inset, body_top + text_inset},
        dimensions(inner_width - 2 * text_inset, line_height - 2 * text_inset));
    text2.with_style(body).with_fill(brush::solid(black));
    rect2.bound_to(text2, frame_padding);

    auto& intro = proj.add_storyboard(storyboard::transition_in());
    animation_timing first;
    first.delay = 0;
    first.duration = 2;
    intro.add(animation_kind::reveal, rect1, first);
    animation_timing second;
    second.delay = 1;
    second.duration = 2;
    intro.add(animation_kind::reveal, text1, second);

    return proj;
  }

} // namespace sdoc
