#ifndef FSTORE_STORAGE_ADAPTER_HPP
#define FSTORE_STORAGE_ADAPTER_HPP

#include <string>
#include "storage/file_record.hpp"
#include "storage/storage_error.hpp"

namespace fstore {
namespace storage {

// Backend capability consumed by FileStorage. Implementations own the actual
// persistence; load() and remove() throw NotFoundError for absent keys.
class StorageAdapter {
public:
  virtual ~StorageAdapter() = default;

  // Persists the record, returns backend success
  virtual bool save(const FileRecord& file) = 0;
  // Returns the record stored under key
  virtual FileRecord load(const std::string& key) = 0;
  // Builds a new empty record bound to key, without persisting it
  virtual FileRecord init(const std::string& key, bool touch) = 0;
  // Removes the record stored under key
  virtual bool remove(const std::string& key) = 0;
};

} // namespace storage
} // namespace fstore

#endif // FSTORE_STORAGE_ADAPTER_HPP
