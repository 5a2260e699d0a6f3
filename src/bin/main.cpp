#include <sdoc/project.hpp>
#include <sdoc/sample.hpp>

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;

static constexpr int exit_success = 0;
static constexpr int exit_usage = 1;
static constexpr int exit_io = 2;
static constexpr int exit_build = 3;

struct sample_options {
  std::string output_dir = ".";
  double width = 1920;
  double height = 1080;
  bool list_outputs = false;
  bool show_help = false;
};

static void
print_usage(std::ostream& os) {
  os << "Usage: sdoc <command> [options]\n"
     << "\n"
     << "Commands:\n"
     << "  sample            Write the parts of a sample scene document\n"
     << "\n"
     << "Options:\n"
     << "  -h, --help        Show this help message\n"
     << "  --version         Show version information\n";
}

static void
print_sample_usage(std::ostream& os) {
  os << "Usage: sdoc sample [options]\n"
     << "\n"
     << "Options:\n"
     << "  -o <dir>          Output directory (default: current directory)\n"
     << "  --width <w>       Canvas width (default: 1920)\n"
     << "  --height <h>      Canvas height (default: 1080)\n"
     << "  --list-outputs    Print the part filenames and exit\n"
     << "  -h, --help        Show this help message\n";
}

static void
print_version(std::ostream& os) {
  os << "sdoc " << SDOC_VERSION << "\n";
}

static double
parse_extent(const std::string& option, const std::string& text) {
  std::size_t used = 0;
  double value = 0;
  try {
    value = std::stod(text, &used);
  } catch (const std::exception&) {
    used = 0;
  }
  if (used != text.size() || !(value > 0)) {
    std::cerr << "sdoc sample: " << option
              << " must be a positive number: " << text << "\n";
    std::exit(exit_usage);
  }
  return value;
}

static sample_options
parse_sample_args(int argc, char* argv[]) {
  sample_options opts;

  // argv[0] is "sdoc", argv[1] is "sample", start at 2
  for (int i = 2; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      opts.show_help = true;
      return opts;
    }

    if (arg == "--list-outputs") {
      opts.list_outputs = true;
      continue;
    }

    if (arg == "-o") {
      if (i + 1 >= argc) {
        std::cerr << "sdoc sample: -o requires an argument\n";
        std::exit(exit_usage);
      }
      opts.output_dir = argv[++i];
      continue;
    }

    if (arg == "--width" || arg == "--height") {
      if (i + 1 >= argc) {
        std::cerr << "sdoc sample: " << arg << " requires an argument\n";
        std::exit(exit_usage);
      }
      double value = parse_extent(arg, argv[++i]);
      (arg == "--width" ? opts.width : opts.height) = value;
      continue;
    }

    std::cerr << "sdoc sample: unknown option: " << arg << "\n";
    std::exit(exit_usage);
  }

  return opts;
}

static int
run_sample(const sample_options& opts) {
  std::optional<sdoc::project> proj;
  try {
    proj.emplace(sdoc::make_sample_project(opts.width, opts.height));
  } catch (const std::invalid_argument& e) {
    std::cerr << "sdoc sample: " << e.what() << "\n";
    return exit_usage;
  } catch (const std::exception& e) {
    std::cerr << "sdoc sample: document build error: " << e.what() << "\n";
    return exit_build;
  }

  std::vector<sdoc::package_part> parts;
  try {
    parts = proj->parts();
  } catch (const std::exception& e) {
    std::cerr << "sdoc sample: serialization error: " << e.what() << "\n";
    return exit_build;
  }

  // --list-outputs: print filenames and exit
  if (opts.list_outputs) {
    for (const auto& part : parts)
      std::cout << part.path << "\n";
    return exit_success;
  }

  try {
    for (const auto& path : proj->write_parts(fs::path(opts.output_dir)))
      std::cout << path.string() << "\n";
  } catch (const std::runtime_error& e) {
    std::cerr << "sdoc sample: " << e.what() << "\n";
    return exit_io;
  }

  return exit_success;
}

int
main(int argc, char* argv[]) {
  if (argc >= 2 && std::string(argv[1]) == "sample") {
    auto opts = parse_sample_args(argc, argv);

    if (opts.show_help) {
      print_sample_usage(std::cerr);
      return exit_success;
    }

    return run_sample(opts);
  }

  if (argc >= 2) {
    std::string arg = argv[1];

    if (arg == "-h" || arg == "--help") {
      print_usage(std::cerr);
      return exit_success;
    }

    if (arg == "--version") {
      print_version(std::cerr);
      return exit_success;
    }

    if (arg[0] == '-')
      std::cerr << "sdoc: unknown option: " << arg << "\n";
    else
      std::cerr << "sdoc: unknown command: " << arg << "\n";
    print_usage(std::cerr);
    return exit_usage;
  }

  std::cerr << "sdoc: no command specified\n";
  print_usage(std::cerr);
  return exit_usage;
}
