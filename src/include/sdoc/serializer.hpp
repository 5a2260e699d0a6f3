#pragma once

#include <sdoc/element.hpp>
#include <sdoc/entity.hpp>

namespace sdoc {

  // Convert an entity graph into a markup tree, depth-first:
  //
  //  - the element is named after the entity's tag;
  //  - schema attributes are visited in schema order; absent values are
  //    skipped when the schema says so;
  //  - an entity value becomes a wrapper child "{Tag}.{Name}" holding the
  //    serialized entity;
  //  - a non-empty collection becomes one wrapper holding every item as a
  //    direct child; an empty one is omitted;
  //  - any other value becomes the attribute {Name} with its text form;
  //  - structural children follow, unwrapped, after all attribute output.
  //
  // {Name} is the PascalCase form of the schema name. The entity graph is
  // not modified; serializing it twice gives equal trees.
  element
  serialize(const entity& root);

  // As above, appending the result to `parent` and returning it.
  element&
  serialize(const entity& e, element& parent);

} // namespace sdoc
