#ifndef FSTORE_STORAGE_MEMORY_ADAPTER_HPP
#define FSTORE_STORAGE_MEMORY_ADAPTER_HPP

#include <map>
#include <mutex>
#include <string>
#include "storage/storage_adapter.hpp"

namespace fstore {
namespace storage {

// Process-local backend keeping every record in a map
class MemoryAdapter : public StorageAdapter {
public:
  MemoryAdapter() = default;

  // ---- ADAPTER OPERATIONS ----
  bool save(const FileRecord& file) override;
  FileRecord load(const std::string& key) override;
  FileRecord init(const std::string& key, bool touch) override;
  bool remove(const std::string& key) override;

  // ---- QUERY OPERATIONS ----
  bool has(const std::string& key) const;
  std::size_t size() const;
  void clear();

private:
  mutable std::mutex mutex_;
  std::map<std::string, std::string> files_;
};

} // namespace storage
} // namespace fstore

#endif // FSTORE_STORAGE_MEMORY_ADAPTER_HPP
