#include "cli/cli.hpp"
#include <fstream>
#include <iterator>
#include <sstream>
#include <boost/log/trivial.hpp>

namespace fstore {
namespace cli {

//==============================================
// CONSTRUCTOR
//==============================================

CLI::CLI(storage::FileStorage& storage, std::istream& in, std::ostream& out)
  : storage_(storage)
  , in_(in)
  , out_(out)
  , running_(false) {
  BOOST_LOG_TRIVIAL(info) << "CLI initialized";
}


//==============================================
// STARTUP
//==============================================

void CLI::run() {
  running_ = true;
  std::string line;

  BOOST_LOG_TRIVIAL(info) << "Starting CLI loop";
  out_ << "fstore> " << std::flush;

  while (running_ && std::getline(in_, line)) {
    running_ = execute(line);
    if (running_) {
      out_ << "fstore> " << std::flush;
    }
  }

  BOOST_LOG_TRIVIAL(info) << "CLI loop ended";
}

bool CLI::execute(const std::string& line) {
  std::istringstream iss(line);
  std::string command, key, rest;

  iss >> command;
  if (command.empty()) {
    return true;
  }
  if (command == "quit") {
    return false;
  }

  iss >> key;
  // Remaining text after a single separating space
  if (iss.peek() == ' ') {
    iss.get();
  }
  std::getline(iss, rest);

  process_command(command, key, rest);
  return true;
}


//==============================================
// COMMAND PROCESSING
//==============================================

void CLI::process_command(const std::string& command, const std::string& key, const std::string& rest) {
  BOOST_LOG_TRIVIAL(debug) << "Processing command: " << command << " with key: " << key;

  if (command == "help") {
    handle_help_command();
  }
  else if (key.empty()) {
    out_ << "Invalid input. Usage: <command> <key> [args]" << std::endl;
  }
  else if (command == "init") {
    handle_init_command(key, rest);
  }
  else if (command == "save") {
    handle_save_command(key, rest);
  }
  else if (command == "store") {
    handle_store_command(key, rest);
  }
  else if (command == "load") {
    handle_load_command(key);
  }
  else if (command == "delete") {
    handle_delete_command(key);
  }
  else {
    out_ << "Unknown command or invalid arguments" << std::endl;
  }
}

void CLI::handle_init_command(const std::string& key, const std::string& flag) {
  if (!flag.empty() && flag != "touch") {
    out_ << "Invalid format. Usage: init <key> [touch]" << std::endl;
    return;
  }

  try {
    storage::FileRecord file = storage_.init(key, flag == "touch");
    out_ << "Initialized " << file.key() << (flag == "touch" ? " (reserved)" : "") << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error initializing file", e.what());
  }
}

void CLI::handle_save_command(const std::string& key, const std::string& text) {
  try {
    bool success = storage_.save(storage::FileRecord(key, text));
    out_ << (success ? "Saved " : "Failed to save ") << key << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error saving file", e.what());
  }
}

void CLI::handle_store_command(const std::string& path, const std::string& key) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    out_ << "Error opening file: " << path << std::endl;
    return;
  }
  std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());

  // Local path doubles as the key unless one is given
  handle_save_command(key.empty() ? path : key, content);
}

void CLI::handle_load_command(const std::string& key) {
  try {
    storage::FileRecord file = storage_.load(key);
    out_ << file.content().value_or("") << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error loading file", e.what());
  }
}

void CLI::handle_delete_command(const std::string& key) {
  try {
    bool success = storage_.remove(key);
    out_ << (success ? "File deleted successfully" : "File was not deleted") << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error deleting file", e.what());
  }
}

void CLI::handle_help_command() {
  out_ << "Available commands:" << std::endl;
  out_ << "  help                Display this help message" << std::endl;
  out_ << "  init <key> [touch]  Create a new file, touch reserves the key" << std::endl;
  out_ << "  save <key> <text>   Save <text> as the content of <key>" << std::endl;
  out_ << "  store <path> [key]  Save a local file under <key> (default <path>)" << std::endl;
  out_ << "  load <key>          Print the content of <key>" << std::endl;
  out_ << "  delete <key>        Delete <key> from storage" << std::endl;
  out_ << "  quit                Exit the shell" << std::endl << std::endl;
}

void CLI::log_and_display_error(const std::string& message, const std::string& error) {
  BOOST_LOG_TRIVIAL(error) << message << ": " << error;
  out_ << message << ": " << error << std::endl;
}

} // namespace cli
} // namespace fstore
