#include <sdoc/project.hpp>
#include <sdoc/serializer.hpp>

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace sdoc {

  namespace {

    constexpr const char* content_types_namespace =
        "http://schemas.openxmlformats.org/package/2006/content-types";

    write_options
    part_options(std::string indent) {
      write_options options;
      options.indent = std::move(indent);
      options.xml_declaration = true;
      options.declared_encoding = "utf-8";
      return options;
    }

  } // namespace

  void
  write(std::ostream& os, const package_part& part) {
    ostream_writer writer(os, part.options);
    part.root.write(writer);
    os << '\n';
  }

  std::string
  to_string(const package_part& part) {
    std::ostringstream os;
    write(os, part);
    return os.str();
  }

  element
  content_types() {
    element types("Types", {{"xmlns", content_types_namespace}});
    types.append(element(
        "Default", {{"Extension", "xml"}, {"ContentType", "text/xml"}}));
    types.append(element(
        "Default", {{"Extension", "png"}, {"ContentType", "image/png"}}));
    return types;
  }

  project::project(double width, double height)
      : document_(std::make_unique<composition>(width, height)) {}

  storyboard&
  project::add_storyboard(std::unique_ptr<storyboard> s) {
    if (!s) throw std::invalid_argument("cannot add a null storyboard");
    storyboard& added = *s;
    storyboards_.push_back(std::move(s));
    return added;
  }

  element
  project::to_element() const {
    element root = serialize(*document_);
    for (const auto& s : storyboards_) {
      serialize(*s, root);
    }
    return root;
  }

  std::vector<package_part>
  project::parts() const {
    std::vector<package_part> result;
    result.push_back({"document.xml", to_element(), part_options("  ")});
    result.push_back({"[Content_Types].xml", content_types(), part_options("")});
    return result;
  }

  std::vector<std::filesystem::path>
  project::write_parts(const std::filesystem::path& dir) const {
    // Render everything first so that a failing document leaves no files.
    auto package = parts();

    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec)
      throw std::runtime_error("cannot create directory " + dir.string() +
                               ": " + ec.message());

    std::vector<std::filesystem::path> written;
    for (const auto& part : package) {
      auto path = dir / part.path;
      std::ofstream out(path, std::ios::binary);
      if (!out) throw std::runtime_error("cannot write file: " + path.string());
      write(out, part);
      if (!out) throw std::runtime_error("error writing file: " + path.string());
      written.push_back(std::move(path));
    }
    return written;
  }

} // namespace sdoc
