#include "storage/memory_adapter.hpp"
#include <boost/log/trivial.hpp>

namespace fstore {
namespace storage {

bool MemoryAdapter::save(const FileRecord& file) {
  std::lock_guard<std::mutex> lock(mutex_);
  files_[file.key()] = file.content().value_or("");
  BOOST_LOG_TRIVIAL(debug) << "MemoryAdapter: Stored " << files_[file.key()].size()
                           << " bytes with key: " << file.key();
  return true;
}

FileRecord MemoryAdapter::load(const std::string& key) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = files_.find(key);
  if (it == files_.end()) {
    BOOST_LOG_TRIVIAL(debug) << "MemoryAdapter: Key not found: " << key;
    throw NotFoundError(key, "No file stored under key");
  }
  return FileRecord(it->first, it->second);
}

FileRecord MemoryAdapter::init(const std::string& key, bool /*touch*/) {
  return FileRecord(key);
}

bool MemoryAdapter::remove(const std::string& key) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (files_.erase(key) == 0) {
    BOOST_LOG_TRIVIAL(debug) << "MemoryAdapter: Cannot remove missing key: " << key;
    throw NotFoundError(key, "No file stored under key");
  }
  BOOST_LOG_TRIVIAL(debug) << "MemoryAdapter: Removed key: " << key;
  return true;
}

bool MemoryAdapter::has(const std::string& key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return files_.count(key) > 0;
}

std::size_t MemoryAdapter::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return files_.size();
}

void MemoryAdapter::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  files_.clear();
}

} // namespace storage
} // namespace fstore
