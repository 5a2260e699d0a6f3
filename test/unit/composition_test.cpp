#include <sdoc/composition.hpp>
#include <sdoc/error.hpp>
#include <sdoc/serializer.hpp>

#include <catch2/catch.hpp>

#include <stdexcept>
#include <string>
#include <vector>

using namespace sdoc;

TEST_CASE("composition requires a size", "[composition]") {
  composition c(1920, 1080);
  CHECK(c.width() == 1920);
  CHECK(c.height() == 1080);
  CHECK(serialize(c) ==
        element("Composition", {{"Width", "1920"}, {"Height", "1080"}}));
  CHECK_THROWS_AS(composition(attribute_map{}), missing_required_attribute);
}

TEST_CASE("layer defaults to the composition's size", "[composition]") {
  composition c(1280, 720);
  layer& l = c.add_layer("Layer 1");

  CHECK(l.name() == "Layer 1");
  CHECK(l.get("location").as_string() == "0,0,0");
  CHECK(l.get("dimensions").as_string() == "1280,720,0");
  CHECK(l.content().width() == 1280);
  CHECK(l.content().height() == 720);
  REQUIRE(c.children().size() == 1);
  CHECK(c.children()[0].get() == &l);
}

TEST_CASE("layer markup nests its composition", "[composition]") {
  composition c(100, 50);
  c.add_layer("L", location{10, 20}, dimensions(30, 40));

  element expected("Composition", {{"Width", "100"}, {"Height", "50"}},
                   {element("Layer",
                            {{"Name", "L"},
                             {"Location", "10,20,0"},
                             {"Dimensions", "30,40,0"}},
                            {element("Layer.Composition", {},
                                     {element("Composition",
                                              {{"Width", "30"},
                                               {"Height", "40"}})})})});
  CHECK(serialize(c) == expected);
}

TEST_CASE("locked layer", "[composition]") {
  layer l("L", location{}, dimensions(10, 10), true);
  CHECK(*serialize(l).find_attribute("Locked") == "True");
}

TEST_CASE("layer without a composition", "[composition]") {
  attribute_map values;
  values.emplace("name", "Bare");
  values.emplace("location", "0,0,0");
  values.emplace("dimensions", "1,1,0");
  layer l(std::move(values));
  CHECK_THROWS_AS(l.content(), std::logic_error);
}

TEST_CASE("object placement is required", "[composition]") {
  attribute_map values;
  values.emplace("name", "R");
  CHECK_THROWS_AS(rectangle(std::move(values)), missing_required_attribute);
}

TEST_CASE("shapes go into the layer's composition", "[composition]") {
  composition c(1920, 1080);
  layer& l = c.add_layer("Layer 1");
  auto& r = l.add_rectangle("Rect 1", location{60, 60}, dimensions(100, 50));
  auto& e = l.add_ellipse("Ellipse 1", location{}, dimensions(10, 10));
  l.add_triangle("Triangle 1", location{}, dimensions(10, 10));
  l.add_right_triangle("Right 1", location{}, dimensions(10, 10));

  const entity_list& shapes = l.content().children();
  REQUIRE(shapes.size() == 4);
  CHECK(shapes[0].get() == &r);
  CHECK(shapes[1].get() == &e);
  CHECK(shapes[2]->tag() == "Triangle");
  CHECK(shapes[3]->tag() == "RightTriangle");
  CHECK(l.children().empty());
}

TEST_CASE("rectangle attribute order", "[composition]") {
  rectangle r("Rect 1", location{60, 60}, dimensions(100, 50));
  r.with_radius(4).with_fill(brush::solid(color::red()));
  r.with_stroke(brush::solid(color::black()), 2).with_opacity(0.5);
  r.with_data_flags(data_flags::show_visible);

  element e = serialize(r);
  std::vector<std::string> names;
  for (const auto& a : e.attributes())
    names.push_back(a.name());
  CHECK(names == std::vector<std::string>{"Name", "Location", "Dimensions",
                                          "DataFlags", "StrokeThickness",
                                          "Opacity", "Radius"});
  CHECK(*e.find_attribute("DataFlags") == "ShowVisible");

  REQUIRE(e.children().size() == 2);
  CHECK(e.children()[0].name() == "Rectangle.Fill");
  CHECK(e.children()[1].name() == "Rectangle.Stroke");
}

TEST_CASE("effects share one wrapper", "[composition]") {
  ellipse e("E", location{}, dimensions(1, 1));
  e.add_effect(effect::flip_x()).add_effect(effect::shadow(3));

  element out = serialize(e);
  REQUIRE(out.children().size() == 1);
  CHECK(out.children()[0].name() == "Ellipse.Effects");
  CHECK(out.children()[0].children().size() == 2);
  CHECK_THROWS_AS(e.add_effect(nullptr), std::invalid_argument);
}

TEST_CASE("bounded rectangle follows a renamed text block", "[composition]") {
  composition c(1920, 1080);
  layer& l = c.add_layer("Layer 1");
  auto& r = l.add_rectangle("Rect 1", location{}, dimensions(10, 10));
  auto& t = l.add_text_block("Text 1", "HERE WE ARE", location{},
                             dimensions(10, 10));
  r.bound_to(t, 15);
  t.rename("Headline");

  element e = serialize(r);
  REQUIRE(e.children().size() == 1);
  CHECK(e.children()[0] ==
        element("Rectangle.Bounding", {},
                {element("Bounding", {{"Object", "Headline"},
                                      {"Padding", "15,15,15,15"}})}));
}

TEST_CASE("text block style", "[composition]") {
  text_style style;
  style.font_family = "Century Gothic";
  style.font_size = 90;
  style.font_weight = "Bold";
  style.auto_size = "WidthAndHeight";

  text_block t("Text 1", "HERE WE ARE", location{}, dimensions(10, 10));
  t.with_style(style);

  element e = serialize(t);
  CHECK(*e.find_attribute("Text") == "HERE WE ARE");
  CHECK(*e.find_attribute("FontFamily") == "Century Gothic");
  CHECK(*e.find_attribute("FontSize") == "90");
  CHECK(*e.find_attribute("FontWeight") == "Bold");
  CHECK(*e.find_attribute("AutoSize") == "WidthAndHeight");
  CHECK(e.find_attribute("TextAlign") == nullptr);

  attribute_map values;
  values.emplace("name", "T");
  values.emplace("location", "0,0,0");
  values.emplace("dimensions", "1,1,0");
  CHECK_THROWS_AS(text_block(std::move(values)), missing_required_attribute);
}

TEST_CASE("ticker ignores style members it does not declare",
          "[composition]") {
  text_style style;
  style.font_size = 20;
  style.auto_size = "Width";

  ticker t("Ticker 1", location{}, dimensions(100, 20));
  t.with_style(style);

  element e = serialize(t);
  CHECK(*e.find_attribute("FontSize") == "20");
  CHECK(e.find_attribute("AutoSize") == nullptr);
  CHECK(t.get("auto_size").is_absent());
}

TEST_CASE("image wraps its bitmap", "[composition]") {
  image i("Logo", "logo.png", location{}, dimensions(64, 64));
  element e = serialize(i);
  REQUIRE(e.children().size() == 1);
  CHECK(e.children()[0] ==
        element("Image.Bitmap", {},
                {element("Bitmap", {{"Source", "logo.png"}})}));
}

TEST_CASE("qr code requires text", "[composition]") {
  composition c(100, 100);
  auto& q = c.add_layer("L").add_qr_code("QR", "https://example.org",
                                         location{}, dimensions(10, 10));
  CHECK(q.tag() == "QRCode");
  CHECK(*serialize(q).find_attribute("Text") == "https://example.org");
}

TEST_CASE("data flag names", "[composition]") {
  CHECK(to_string(data_flags::hidden) == "Hidden");
  CHECK(to_string(data_flags::show_visible) == "ShowVisible");
  CHECK(to_string(data_flags::none) == "None");
}
