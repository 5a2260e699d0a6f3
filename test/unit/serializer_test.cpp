#include <sdoc/color.hpp>
#include <sdoc/error.hpp>
#include <sdoc/object_attributes.hpp>
#include <sdoc/serializer.hpp>

#include <catch2/catch.hpp>

#include <memory>
#include <stdexcept>
#include <string>

using namespace sdoc;

namespace {

  // Tag "Panel": a scalar, a kept-when-absent scalar, a nested entity,
  // a collection and a reference.
  struct panel : entity {
    using base_type = entity;

    static const attribute_list&
    declared_attributes() {
      static const attribute_list attributes = {
          attribute_schema::required("name", value_kind::string),
          attribute_schema("caption", value_kind::string, std::nullopt, false,
                           false),
          attribute_schema::optional("fill", value_kind::entity),
          attribute_schema::optional("stops", value_kind::entity_list),
          attribute_schema::optional("visible", value_kind::boolean),
          attribute_schema::optional("target", value_kind::reference),
      };
      return attributes;
    }

    static const entity_schema&
    describe() {
      static const entity_schema schema = lineage_schema<panel>();
      return schema;
    }

    explicit panel(std::string name)
        : entity("Panel", describe(), [&] {
            attribute_map values;
            values.emplace("name", std::move(name));
            return values;
          }()) {}
  };

} // namespace

TEST_CASE("absent scalar is omitted", "[serializer]") {
  gradient_stop stop(color::red());
  element e = serialize(stop);

  CHECK(e.name() == "GradientStop");
  REQUIRE(e.attributes().size() == 1);
  CHECK(e.attributes()[0].name() == "Color");
  CHECK(e.attributes()[0].value() == "#FFFF0000");
  CHECK(e.find_attribute("Position") == nullptr);
  CHECK(e.children().empty());
}

TEST_CASE("attributes follow schema order with PascalCase names",
          "[serializer]") {
  gradient_stop stop(color::red(), 0.5);
  element e = serialize(stop);
  REQUIRE(e.attributes().size() == 2);
  CHECK(e.attributes()[0].name() == "Color");
  CHECK(e.attributes()[1].name() == "Position");
  CHECK(e.attributes()[1].value() == "0.5");
}

TEST_CASE("collection items share one wrapper", "[serializer]") {
  auto b = brush::linear_gradient(
      make_entity_list(std::make_unique<gradient_stop>(color::red(), 0.0),
                       std::make_unique<gradient_stop>(color::blue(), 1.0)));
  element e = serialize(*b);

  CHECK(e.name() == "Brush");
  CHECK(*e.find_attribute("Type") == "LinearGradient");
  REQUIRE(e.children().size() == 1);
  const element& wrapper = e.children()[0];
  CHECK(wrapper.name() == "Brush.Stops");
  CHECK(wrapper.attributes().empty());
  REQUIRE(wrapper.children().size() == 2);
  CHECK(wrapper.children()[0].name() == "GradientStop");
  CHECK(wrapper.children()[1].name() == "GradientStop");
  CHECK(*wrapper.children()[1].find_attribute("Color") == "#FF0000FF");
}

TEST_CASE("nested entity is wrapped under its own tag", "[serializer]") {
  panel p("P");
  p.set("fill", brush::solid(color::white()));
  element e = serialize(p);

  REQUIRE(e.children().size() == 1);
  const element& wrapper = e.children()[0];
  CHECK(wrapper.name() == "Panel.Fill");
  CHECK(wrapper.attributes().empty());
  REQUIRE(wrapper.children().size() == 1);
  CHECK(wrapper.children()[0].name() == "Brush");
  CHECK(*wrapper.children()[0].find_attribute("Color") == "#FFFFFFFF");
}

TEST_CASE("empty collection is omitted", "[serializer]") {
  panel p("P");
  element e = serialize(p);
  CHECK(e.children().empty());
  CHECK(e.find_attribute("Stops") == nullptr);
}

TEST_CASE("absent value kept when the schema asks for it", "[serializer]") {
  panel p("P");
  element e = serialize(p);
  const std::string* caption = e.find_attribute("Caption");
  REQUIRE(caption != nullptr);
  CHECK(caption->empty());
  CHECK(e.find_attribute("Visible") == nullptr);
}

TEST_CASE("booleans and references become attributes", "[serializer]") {
  panel target("Target");
  panel p("P");
  p.set("visible", false);
  p.set("target", reference(target));
  target.set("name", "Renamed");

  element e = serialize(p);
  CHECK(*e.find_attribute("Visible") == "False");
  CHECK(*e.find_attribute("Target") == "Renamed");
  REQUIRE(e.attributes().size() == 4);
  CHECK(e.attributes()[0].name() == "Name");
  CHECK(e.attributes()[1].name() == "Caption");
  CHECK(e.attributes()[2].name() == "Visible");
  CHECK(e.attributes()[3].name() == "Target");
}

TEST_CASE("unresolved reference propagates", "[serializer]") {
  panel p("P");
  p.set("target", reference(p, "missing_key"));
  CHECK_THROWS_AS(serialize(p), unresolved_reference);
}

TEST_CASE("wrapped attributes precede plain children", "[serializer]") {
  panel p("Parent");
  p.append_child(std::make_unique<panel>("Child"));
  p.set("fill", brush::solid(color::black()));
  p.list("stops").push_back(std::make_unique<gradient_stop>(color::red()));

  element e = serialize(p);
  REQUIRE(e.children().size() == 3);
  CHECK(e.children()[0].name() == "Panel.Fill");
  CHECK(e.children()[1].name() == "Panel.Stops");
  CHECK(e.children()[2].name() == "Panel");
  CHECK(*e.children()[2].find_attribute("Name") == "Child");
}

TEST_CASE("names outside the schema are not emitted", "[serializer]") {
  panel p("P");
  p.set("extra", "value");
  element e = serialize(p);
  CHECK(e.find_attribute("Extra") == nullptr);
}

TEST_CASE("null collection item is rejected", "[serializer]") {
  panel p("P");
  p.list("stops").push_back(nullptr);
  CHECK_THROWS_AS(serialize(p), std::invalid_argument);
}

TEST_CASE("serialize into a parent appends", "[serializer]") {
  element root("Root");
  panel p("P");
  element& added = serialize(p, root);
  REQUIRE(root.children().size() == 1);
  CHECK(&added == &root.children()[0]);
  CHECK(added.name() == "Panel");
}

TEST_CASE("serialization is idempotent", "[serializer]") {
  panel target("Target");
  panel p("P");
  p.set("fill", brush::solid(color::red()));
  p.set("target", reference(target));
  p.append_child(std::make_unique<panel>("Child"));

  element first = serialize(p);
  element second = serialize(p);
  CHECK(first == second);
  CHECK(to_string(first) == to_string(second));
}
