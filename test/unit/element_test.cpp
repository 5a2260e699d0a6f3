#include <sdoc/element.hpp>
#include <sdoc/ostream_writer.hpp>

#include <catch2/catch.hpp>

#include <sstream>
#include <stdexcept>
#include <string>

using namespace sdoc;

TEST_CASE("element: name, attributes and children", "[element]") {
  element e("Rectangle", {{"Name", "Rect 1"}, {"Radius", "4"}});
  e.append(element("Rectangle.Fill"));

  CHECK(e.name() == "Rectangle");
  REQUIRE(e.attributes().size() == 2);
  CHECK(e.attributes()[1].name() == "Radius");
  REQUIRE(e.children().size() == 1);
  CHECK(e.children()[0].name() == "Rectangle.Fill");
}

TEST_CASE("element: find_attribute", "[element]") {
  element e("Layer", {{"Name", "Layer 1"}});
  REQUIRE(e.find_attribute("Name") != nullptr);
  CHECK(*e.find_attribute("Name") == "Layer 1");
  CHECK(e.find_attribute("Locked") == nullptr);
}

TEST_CASE("element: set_attribute replaces in place", "[element]") {
  element e("Brush", {{"Color", "#FF000000"}, {"Type", "Solid"}});
  e.set_attribute("Color", "#FFFFFFFF");
  e.set_attribute("StartPoint", "0,0");

  REQUIRE(e.attributes().size() == 3);
  CHECK(e.attributes()[0] == element_attribute("Color", "#FFFFFFFF"));
  CHECK(e.attributes()[1].name() == "Type");
  CHECK(e.attributes()[2].name() == "StartPoint");
}

TEST_CASE("element: append returns the new child", "[element]") {
  element root("Composition");
  element& layer = root.append(element("Layer"));
  layer.set_attribute("Name", "Layer 1");
  CHECK(*root.children()[0].find_attribute("Name") == "Layer 1");
}

TEST_CASE("element: structural equality", "[element]") {
  element a("A", {{"X", "1"}}, {element("B")});
  element b("A", {{"X", "1"}}, {element("B")});
  element c("A", {{"X", "2"}}, {element("B")});
  element d("A", {{"X", "1"}});
  CHECK(a == b);
  CHECK_FALSE(a == c);
  CHECK_FALSE(a == d);
}

TEST_CASE("element: compact stream rendering", "[element]") {
  element e("Brush", {{"Type", "Solid"}}, {element("Brush.Stops")});
  std::ostringstream os;
  os << e;
  CHECK(os.str() == R"(<Brush Type="Solid"><Brush.Stops/></Brush>)");
}

TEST_CASE("element: write through a writer", "[element]") {
  element e("A", {{"Q", "\"quoted\""}}, {element("B"), element("C")});
  std::ostringstream os;
  ostream_writer writer(os);
  e.write(writer);
  CHECK(os.str() == R"(<A Q="&quot;quoted&quot;"><B/><C/></A>)");
}

TEST_CASE("element: to_string with indentation", "[element]") {
  element e("A", {}, {element("B")});
  CHECK(to_string(e) == "<A><B/></A>");
  CHECK(to_string(e, "  ") == "<A>\n  <B/>\n</A>");
}

TEST_CASE("element: parse builds the tree", "[element]") {
  auto e = element::parse(R"(
    <Composition Width="1920" Height="1080">
      <Layer Name="Layer 1"/>
    </Composition>)");

  CHECK(e.name() == "Composition");
  CHECK(*e.find_attribute("Width") == "1920");
  REQUIRE(e.children().size() == 1);
  CHECK(e.children()[0] == element("Layer", {{"Name", "Layer 1"}}));
}

TEST_CASE("element: parse rejects text content", "[element]") {
  CHECK_THROWS_AS(element::parse("<a>text</a>"), std::runtime_error);
}

TEST_CASE("element: written text parses back equal", "[element]") {
  element e("Storyboard", {{"Type", "TransitionIn"}},
            {element("Storyboard.Animations", {},
                     {element("Reveal", {{"Object", "R & D"}})})});
  CHECK(element::parse(to_string(e, "  ")) == e);
}
