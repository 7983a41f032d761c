#pragma once

#include <iostream>
#include <string>
#include "storage/file_storage.hpp"

namespace fstore {
namespace cli {

class CLI {
public:
  // ---- CONSTRUCTOR ----
  CLI(storage::FileStorage& storage, std::istream& in = std::cin, std::ostream& out = std::cout);


  // ---- STARTUP ----
  void run();

  // Executes a single shell line, returns false once "quit" is seen
  bool execute(const std::string& line);

private:
  // ---- PARAMETERS ----
  storage::FileStorage& storage_;
  std::istream& in_;
  std::ostream& out_;
  bool running_;


  // ---- COMMAND PROCESSING ----
  void process_command(const std::string& command, const std::string& key, const std::string& rest);
  void handle_init_command(const std::string& key, const std::string& flag);
  void handle_save_command(const std::string& key, const std::string& text);
  void handle_store_command(const std::string& path, const std::string& key);
  void handle_load_command(const std::string& key);
  void handle_delete_command(const std::string& key);
  void handle_help_command();
  void log_and_display_error(const std::string& message, const std::string& error);
};

} // namespace cli
} // namespace fstore
