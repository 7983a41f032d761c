#include "cli/options.hpp"

namespace fstore {
namespace cli {

void print_usage(const std::string& program_name, std::ostream& err) {
  err << "Usage: " << program_name << " [options]\n"
      << "Options:\n"
      << "  -d, --dir <path>      Storage directory (default: fstore_data)\n"
      << "  -m, --memory          Keep files in memory instead of on disk\n"
      << "  -l, --log <file>      Write log to <file> instead of the console\n"
      << "      --log-level <lvl> trace, debug, info, warning, error or fatal\n"
      << "  -v, --verbose         Shorthand for --log-level debug\n"
      << "Example: " << program_name << " -d /tmp/store -l fstore.log\n";
}

ProgramOptions parse_command_line(int argc, const char* const argv[], std::ostream& err) {
  ProgramOptions options;
  const std::string program_name = argc > 0 ? argv[0] : "fstore";

  for (int i = 1; i < argc; ++i) {
    const std::string flag(argv[i]);
    const bool takes_value = flag == "-d" || flag == "--dir" || flag == "-l" ||
                             flag == "--log" || flag == "--log-level";

    if (takes_value && i + 1 >= argc) {
      err << "Error: Missing value for " << flag << '\n';
      print_usage(program_name, err);
      return options;
    }

    if (flag == "-d" || flag == "--dir") {
      options.data_dir = argv[++i];
    } else if (flag == "-l" || flag == "--log") {
      options.log_file = argv[++i];
    } else if (flag == "--log-level") {
      const std::string level(argv[++i]);
      if (!logging::parse_severity(level, options.log_level)) {
        err << "Error: Unknown log level: " << level << '\n';
        print_usage(program_name, err);
        return options;
      }
    } else if (flag == "-m" || flag == "--memory") {
      options.use_memory = true;
    } else if (flag == "-v" || flag == "--verbose") {
      options.log_level = logging::severity_level::debug;
    } else {
      err << "Error: Unknown argument: " << flag << '\n';
      print_usage(program_name, err);
      return options;
    }
  }

  if (!options.use_memory && options.data_dir.empty()) {
    err << "Error: Storage directory cannot be empty\n";
    print_usage(program_name, err);
    return options;
  }

  options.valid = true;
  return options;
}

} // namespace cli
} // namespace fstore
