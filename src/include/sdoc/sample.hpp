#pragma once

#include <sdoc/project.hpp>

namespace sdoc {

  // A small broadcast scene on a canvas of the given size: two layers each
  // holding a text block framed by a bounded rectangle, and a transition-in
  // storyboard revealing the first layer's objects. Throws
  // std::invalid_argument when the canvas is narrower than 152 or shorter
  // than 320, which cannot hold the layout.
  project
  make_sample_project(double width = 1920, double height = 1080);

} // namespace sdoc
