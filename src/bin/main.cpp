#include <csb/api.hpp>
#include <csb/codegen.hpp>
#include <csb/cs_writer.hpp>
#include <csb/expat_reader.hpp>
#include <csb/model_reader.hpp>
#include <csb/type_map.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

static constexpr int exit_success = 0;
static constexpr int exit_usage = 1;
static constexpr int exit_io = 2;
static constexpr int exit_parse = 3;
static constexpr int exit_codegen = 4;

struct cli_options {
  std::vector<std::string> model_files;
  std::string output_dir = ".";
  std::string type_map_file;
  csb::codegen_options codegen;
  bool show_help = false;
  bool show_version = false;
  bool list_outputs = false;
};

static void
print_usage(std::ostream& os) {
  os << "Usage: csb [options] <model.xml> [model2.xml ...]\n"
     << "\n"
     << "Options:\n"
     << "  -o <dir>          Output directory (default: current directory)\n"
     << "  -t <file>         Type map override file\n"
     << "  -r <ns>           Root namespace of the generated code "
        "(default: Api)\n"
     << "  --runtime <ns>    Namespace of the encoding runtime "
        "(default: Api.Runtime)\n"
     << "  --list-outputs    Print expected output paths and exit\n"
     << "  -h, --help        Show this help message\n"
     << "  --version         Show version information\n";
}

static void
print_version(std::ostream& os) {
  os << "csb " << CSB_VERSION << "\n";
}

static std::string
option_argument(int argc, char* argv[], int& i, const std::string& arg) {
  if (i + 1 >= argc) {
    std::cerr << "csb: " << arg << " requires an argument\n";
    std::exit(exit_usage);
  }
  return argv[++i];
}

static cli_options
parse_args(int argc, char* argv[]) {
  cli_options opts;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      opts.show_help = true;
      return opts;
    }

    if (arg == "--version") {
      opts.show_version = true;
      return opts;
    }

    if (arg == "--list-outputs") {
      opts.list_outputs = true;
      continue;
    }

    if (arg == "-o") {
      opts.output_dir = option_argument(argc, argv, i, arg);
      continue;
    }

    if (arg == "-t") {
      opts.type_map_file = option_argument(argc, argv, i, arg);
      continue;
    }

    if (arg == "-r") {
      opts.codegen.root_namespace = option_argument(argc, argv, i, arg);
      continue;
    }

    if (arg == "--runtime") {
      opts.codegen.runtime_namespace = option_argument(argc, argv, i, arg);
      continue;
    }

    if (arg[0] == '-') {
      std::cerr << "csb: unknown option: " << arg << "\n";
      std::exit(exit_usage);
    }

    opts.model_files.push_back(arg);
  }

  return opts;
}

static std::string
read_file(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    std::cerr << "csb: cannot open file: " << path << "\n";
    std::exit(exit_io);
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

static int
write_output(const std::string& output_dir, const std::string& relative,
             const std::string& text) {
  auto path = fs::path(output_dir) / relative;
  std::error_code ec;
  fs::create_directories(path.parent_path(), ec);
  if (ec) {
    std::cerr << "csb: cannot create directory: "
              << path.parent_path().string() << ": " << ec.message() << "\n";
    return exit_io;
  }
  std::ofstream out(path, std::ios::binary);
  if (!out) {
    std::cerr << "csb: cannot write file: " << path.string() << "\n";
    return exit_io;
  }
  out << text;
  return exit_success;
}

static int
run(const cli_options& opts) {
  csb::api model;
  for (const auto& file : opts.model_files) {
    std::string xml = read_file(file);
    try {
      csb::expat_reader reader(xml);
      csb::model_reader parser;
      for (auto& ns : parser.parse(reader))
        model.add(std::move(ns));
    } catch (const std::exception& e) {
      std::cerr << "csb: parse error: " << file << ": " << e.what() << "\n";
      return exit_parse;
    }
  }

  try {
    model.resolve();
  } catch (const std::exception& e) {
    std::cerr << "csb: resolve error: " << e.what() << "\n";
    return exit_parse;
  }

  auto types = csb::type_map::defaults();
  if (!opts.type_map_file.empty()) {
    std::string xml = read_file(opts.type_map_file);
    try {
      csb::expat_reader reader(xml);
      types.merge(csb::type_map::load(reader));
    } catch (const std::exception& e) {
      std::cerr << "csb: type map error: " << opts.type_map_file << ": "
                << e.what() << "\n";
      return exit_parse;
    }
  }

  std::vector<csb::cs_file> files;
  csb::cs_doc_file summaries;
  try {
    csb::codegen gen(model, types, opts.codegen);
    files = gen.generate();
    summaries = gen.namespace_summaries();
  } catch (const std::exception& e) {
    std::cerr << "csb: code generation error: " << e.what() << "\n";
    return exit_codegen;
  }

  if (opts.list_outputs) {
    for (const auto& file : files)
      std::cout << file.path << "\n";
    std::cout << summaries.path << "\n";
    return exit_success;
  }

  csb::cs_writer writer;
  for (const auto& file : files) {
    int rc = write_output(opts.output_dir, file.path, writer.write(file));
    if (rc != exit_success) return rc;
  }
  return write_output(opts.output_dir, summaries.path, writer.write(summaries));
}

int
main(int argc, char* argv[]) {
  auto opts = parse_args(argc, argv);

  if (opts.show_help) {
    print_usage(std::cout);
    return exit_success;
  }

  if (opts.show_version) {
    print_version(std::cout);
    return exit_success;
  }

  if (opts.model_files.empty()) {
    std::cerr << "csb: no model files specified\n";
    print_usage(std::cerr);
    return exit_usage;
  }

  return run(opts);
}
