#include <sdoc/composition.hpp>
#include <sdoc/error.hpp>
#include <sdoc/serializer.hpp>
#include <sdoc/storyboard.hpp>

#include <catch2/catch.hpp>

#include <stdexcept>
#include <string>

using namespace sdoc;

namespace {

  rectangle&
  make_target(composition& c, std::string name) {
    return c.add_layer("Layer").add_rectangle(std::move(name), location{},
                                             dimensions(10, 10));
  }

} // namespace

TEST_CASE("storyboard factories set the type", "[storyboard]") {
  CHECK(storyboard::page(3)->type() == "Page 3");
  CHECK(storyboard::continuous()->type() == "Continuous");
  CHECK(storyboard::transition_in()->type() == "TransitionIn");
  CHECK(storyboard::transition_out()->type() == "TransitionOut");

  auto in = storyboard::data_change_in("Text 1.Text");
  CHECK(in->type() == "DataChangeIn");
  CHECK(in->get("data_name").as_string() == "Text 1.Text");
  CHECK(storyboard::data_change_out("Score.Value")->type() == "DataChangeOut");
}

TEST_CASE("storyboard requires a type", "[storyboard]") {
  CHECK_THROWS_AS(storyboard(attribute_map{}), missing_required_attribute);
}

TEST_CASE("animations are listed under one wrapper", "[storyboard]") {
  composition c(100, 100);
  auto& a = make_target(c, "Test");
  auto& b = make_target(c, "append");
  auto& f = make_target(c, "function");

  auto s = storyboard::transition_in();
  s->add(animation_kind::bounce, a);
  s->add(animation_kind::expand, b);
  s->add(animation_kind::fade, f);

  CHECK(to_string(serialize(*s)) ==
        "<Storyboard Type=\"TransitionIn\"><Storyboard.Animations>"
        "<Bounce Object=\"Test\"/><Expand Object=\"append\"/>"
        "<Fade Object=\"function\"/></Storyboard.Animations></Storyboard>");
}

TEST_CASE("empty storyboard has no wrapper", "[storyboard]") {
  CHECK(serialize(*storyboard::page(0)) ==
        element("Storyboard", {{"Type", "Page 0"}}));
}

TEST_CASE("data change storyboard attribute order", "[storyboard]") {
  auto s = storyboard::data_change_out("Score.Value");
  element e = serialize(*s);
  REQUIRE(e.attributes().size() == 2);
  CHECK(e.attributes()[0] == element_attribute("DataName", "Score.Value"));
  CHECK(e.attributes()[1] == element_attribute("Type", "DataChangeOut"));
}

TEST_CASE("animation timing options", "[storyboard]") {
  composition c(100, 100);
  auto& target = make_target(c, "Rect 1");

  animation_timing timing;
  timing.duration = 2;
  timing.delay = 0.5;
  timing.speed = 1.5;
  timing.interpolation = interpolation::cubic_easing_in_out;
  timing.direction = direction::left;
  timing.reverse = true;
  timing.center_axis = center_axis::y;

  animation a(animation_kind::fly, target, timing);
  CHECK(serialize(a) == element("Fly", {{"Object", "Rect 1"},
                                        {"Duration", "2"},
                                        {"Speed", "1.5"},
                                        {"Delay", "0.5"},
                                        {"Interpolation", "CubicEasingInOut"},
                                        {"Direction", "Left"},
                                        {"Reverse", "True"},
                                        {"CenterAxis", "Y"}}));
}

TEST_CASE("animation follows its renamed object", "[storyboard]") {
  composition c(100, 100);
  auto& target = make_target(c, "Before");
  auto s = storyboard::continuous();
  animation& a = s->add(animation_kind::reveal, target);
  target.rename("After");

  CHECK(a.tag() == "Reveal");
  CHECK(*serialize(a).find_attribute("Object") == "After");
}

TEST_CASE("animation requires an object", "[storyboard]") {
  CHECK_THROWS_AS(animation("Fade", attribute_map{}),
                  missing_required_attribute);
}

TEST_CASE("append keeps order and rejects null", "[storyboard]") {
  composition c(100, 100);
  auto& target = make_target(c, "R");
  storyboard s("Custom");
  s.append(std::make_unique<animation>(animation_kind::zoom, target));
  s.append(std::make_unique<animation>(animation_kind::zoom_fade, target));

  REQUIRE(s.animations().size() == 2);
  CHECK(s.animations()[0]->tag() == "Zoom");
  CHECK(s.animations()[1]->tag() == "ZoomFade");
  CHECK_THROWS_AS(s.append(nullptr), std::invalid_argument);
}

TEST_CASE("animation kind tags", "[storyboard]") {
  CHECK(to_string(animation_kind::fill_offset) == "FillOffset");
  CHECK(to_string(animation_kind::hidden) == "Hidden");
  CHECK(to_string(animation_kind::image_sequence_loop) == "ImageSequenceLoop");
  CHECK(to_string(animation_kind::none) == "None");
  CHECK(to_string(animation_kind::rotate) == "Rotate");
  CHECK(to_string(animation_kind::rotate_continuous) == "RotateContinuous");
  CHECK(to_string(animation_kind::stroke_offset) == "StrokeOffset");
  CHECK(to_string(interpolation::bounce_out) == "BounceOut");
  CHECK(to_string(direction::down) == "Down");
  CHECK(to_string(center_axis::x) == "X");
}
