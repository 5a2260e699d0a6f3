#pragma once

#include <sdoc/composition.hpp>
#include <sdoc/element.hpp>
#include <sdoc/ostream_writer.hpp>
#include <sdoc/storyboard.hpp>

#include <filesystem>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace sdoc {

  // One generated file of a package: its path inside the package, its
  // markup and how it is rendered.
  struct package_part {
    std::string path;
    element root;
    write_options options;
  };

  // Render a part's markup, terminated by a newline.
  void
  write(std::ostream& os, const package_part& part);

  std::string
  to_string(const package_part& part);

  // The [Content_Types].xml markup: default content types for the xml and
  // png entries of a package.
  element
  content_types();

  // A scene document: the root composition together with the storyboards
  // that animate it.
  class project {
    std::unique_ptr<composition> document_;
    std::vector<std::unique_ptr<storyboard>> storyboards_;

  public:
    project(double width, double height);

    composition&
    document() {
      return *document_;
    }

    const composition&
    document() const {
      return *document_;
    }

    layer&
    add_layer(std::string name, std::optional<location> at = std::nullopt,
              std::optional<dimensions> size = std::nullopt) {
      return document_->add_layer(std::move(name), at, size);
    }

    storyboard&
    add_storyboard(std::unique_ptr<storyboard> s);

    const std::vector<std::unique_ptr<storyboard>>&
    storyboards() const {
      return storyboards_;
    }

    // The composition's markup with every storyboard appended after the
    // layers.
    element
    to_element() const;

    // document.xml followed by [Content_Types].xml.
    std::vector<package_part>
    parts() const;

    // Write every part below `dir`, creating it first. Throws
    // std::runtime_error when a file cannot be written. Returns the paths
    // written.
    std::vector<std::filesystem::path>
    write_parts(const std::filesystem::path& dir) const;
  };

} // namespace sdoc
