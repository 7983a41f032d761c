#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include "storage/storage_adapter.hpp"

namespace fstore {
namespace storage {

// Content-addressed filesystem backend. Keys are hashed with SHA-256 and
// the record lives at {base_path}/{hash[0:2]}/{hash[2:4]}/{hash[4:6]}/{rest}.
// Each file starts with "<key length>\n<key>" followed by the content bytes.
class LocalAdapter : public StorageAdapter {
public:

  // ---- CONSTRUCTOR ----
  explicit LocalAdapter(const std::string& base_path);


  // ---- ADAPTER OPERATIONS ----
  bool save(const FileRecord& file) override;
  FileRecord load(const std::string& key) override;
  FileRecord init(const std::string& key, bool touch) override;
  bool remove(const std::string& key) override;


  // ---- QUERY OPERATIONS ----
  // Checks if a record exists for key
  bool has(const std::string& key) const;
  // Size of the stored file in bytes, header included
  std::uintmax_t file_size(const std::string& key) const;
  // Removes all stored data and resets the base directory
  void clear();
  const std::filesystem::path& base_path() const { return base_path_; }

private:
  // ---- PARAMETERS ----
  std::filesystem::path base_path_;


  // ---- CAS STORAGE SUPPORT ----
  // Generate SHA-256 hex digest of key using OpenSSL EVP
  std::string hash_key(const std::string& key) const;
  std::filesystem::path get_path_for_hash(const std::string& hash) const;
  std::filesystem::path resolve_key_path(const std::string& key) const;


  // ---- UTILITY METHODS ----
  void check_directory_exists(const std::filesystem::path& path) const;
  // Deletes now-empty shard directories, walking up from path
  void prune_empty_dirs(std::filesystem::path path) const;
};

// Raised for I/O and hashing failures inside LocalAdapter
class AdapterError : public std::runtime_error {
public:
  explicit AdapterError(const std::string& message) : std::runtime_error(message) {}
};

} // namespace storage
} // namespace fstore
