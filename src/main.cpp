#include <iostream>
#include <memory>
#include "cli/cli.hpp"
#include "cli/options.hpp"
#include "logger/logger.hpp"
#include "storage/file_storage.hpp"
#include "storage/local_adapter.hpp"
#include "storage/memory_adapter.hpp"

namespace {

std::shared_ptr<fstore::storage::StorageAdapter> make_adapter(const fstore::cli::ProgramOptions& options) {
  if (options.use_memory) {
    LOG_INFO << "Using in-memory storage";
    return std::make_shared<fstore::storage::MemoryAdapter>();
  }
  LOG_INFO << "Using local storage at " << options.data_dir;
  return std::make_shared<fstore::storage::LocalAdapter>(options.data_dir);
}

} // namespace

int main(int argc, char* argv[]) {
  fstore::cli::ProgramOptions options = fstore::cli::parse_command_line(argc, argv, std::cerr);
  if (!options.valid) {
    return 1;
  }

  try {
    if (options.log_file.empty()) {
      fstore::logging::init_console_logging(options.log_level);
    } else {
      fstore::logging::init_logging(options.log_file, options.log_level);
    }

    fstore::storage::FileStorage storage(make_adapter(options));
    fstore::cli::CLI cli(storage);
    cli.run();
  }
  catch (const std::exception& e) {
    LOG_FATAL << "Fatal error: " << e.what();
    std::cerr << "Fatal error: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
