#ifndef FSTORE_STORAGE_FILE_STORAGE_HPP
#define FSTORE_STORAGE_FILE_STORAGE_HPP

#include <memory>
#include <string>
#include "storage/file_record.hpp"
#include "storage/storage_adapter.hpp"
#include "storage/storage_error.hpp"

namespace fstore {
namespace storage {

class FileStorage {
public:
  // ---- CONSTRUCTOR ----
  explicit FileStorage(std::shared_ptr<StorageAdapter> adapter);


  // ---- FILE OPERATIONS ----
  // Saves changes to file; throws InvalidKeyError or EmptyContentError
  bool save(const FileRecord& file);
  // Loads a file for reading and modifying; NotFoundError comes from the adapter
  FileRecord load(const std::string& key);
  // Initializes a new file object for further modifying. With touch enabled
  // the empty file is saved immediately, reserving the key at the cost of an
  // extra backend request. Throws AlreadyExistsError if the key is taken.
  // The existence check and the creation are not atomic.
  FileRecord init(const std::string& key, bool touch = false);
  // Deletes file from storage; NotFoundError comes from the adapter
  bool remove(const std::string& key);

private:
  // ---- PARAMETERS ----
  std::shared_ptr<StorageAdapter> adapter_;

  // Throws InvalidKeyError unless key is non-empty after trimming
  bool validate_key(const std::string& key) const;
};

} // namespace storage
} // namespace fstore

#endif // FSTORE_STORAGE_FILE_STORAGE_HPP
