#include <sdoc/value_format.hpp>

#include <catch2/catch.hpp>

#include <cstdint>
#include <limits>

using namespace sdoc;

TEST_CASE("booleans use capitalised words", "[value_format]") {
  CHECK(format(true) == "True");
  CHECK(format(false) == "False");
}

TEST_CASE("integers are decimal", "[value_format]") {
  CHECK(format(std::int64_t{0}) == "0");
  CHECK(format(std::int64_t{42}) == "42");
  CHECK(format(std::int64_t{-7}) == "-7");
}

TEST_CASE("doubles use the shortest exact form", "[value_format]") {
  CHECK(format(150.0) == "150");
  CHECK(format(0.5) == "0.5");
  CHECK(format(-2.25) == "-2.25");
  CHECK(format(0.1) == "0.1");
}

TEST_CASE("non-finite doubles", "[value_format]") {
  CHECK(format(std::numeric_limits<double>::infinity()) == "Infinity");
  CHECK(format(-std::numeric_limits<double>::infinity()) == "-Infinity");
  CHECK(format(std::numeric_limits<double>::quiet_NaN()) == "NaN");
}

TEST_CASE("strings pass through", "[value_format]") {
  CHECK(format(std::string("Century Gothic")) == "Century Gothic");
  CHECK(format(std::string()).empty());
}
