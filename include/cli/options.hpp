#ifndef FSTORE_CLI_OPTIONS_HPP
#define FSTORE_CLI_OPTIONS_HPP

#include <ostream>
#include <string>
#include "logger/logger.hpp"

namespace fstore {
namespace cli {

struct ProgramOptions {
  std::string data_dir{"fstore_data"};
  bool use_memory{false};
  std::string log_file;  // empty logs to the console
  logging::severity_level log_level{logging::severity_level::warning};
  bool valid{false};
};

void print_usage(const std::string& program_name, std::ostream& err);

// Parses argv; on failure prints the problem and usage to err and returns
// options with valid == false
ProgramOptions parse_command_line(int argc, const char* const argv[], std::ostream& err);

} // namespace cli
} // namespace fstore

#endif // FSTORE_CLI_OPTIONS_HPP
