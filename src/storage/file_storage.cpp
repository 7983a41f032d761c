#include "storage/file_storage.hpp"
#include <stdexcept>
#include <boost/log/trivial.hpp>

namespace fstore {
namespace storage {

//==============================================
// CONSTRUCTOR
//==============================================

FileStorage::FileStorage(std::shared_ptr<StorageAdapter> adapter)
  : adapter_(std::move(adapter)) {
  if (!adapter_) {
    BOOST_LOG_TRIVIAL(error) << "FileStorage: No storage adapter provided";
    throw std::invalid_argument("FileStorage: Storage adapter cannot be null");
  }
  BOOST_LOG_TRIVIAL(debug) << "FileStorage: Initialized";
}


//==============================================
// FILE OPERATIONS
//==============================================

bool FileStorage::save(const FileRecord& file) {
  validate_key(file.key());

  if (!file.has_content()) {
    BOOST_LOG_TRIVIAL(error) << "FileStorage: Refusing to save empty file with key: " << file.key();
    throw EmptyContentError(file.key(), "Cannot save an empty file.");
  }

  BOOST_LOG_TRIVIAL(debug) << "FileStorage: Saving file with key: " << file.key();
  return adapter_->save(file);
}

FileRecord FileStorage::load(const std::string& key) {
  validate_key(key);

  BOOST_LOG_TRIVIAL(debug) << "FileStorage: Loading file with key: " << key;
  return adapter_->load(key);
}

FileRecord FileStorage::init(const std::string& key, bool touch) {
  validate_key(key);

  try {
    load(key);
  } catch (const NotFoundError&) {
    // Absent key, safe to create
    BOOST_LOG_TRIVIAL(debug) << "FileStorage: Initializing new file with key: " << key
                             << (touch ? " (touch)" : "");
    FileRecord file = adapter_->init(key, touch);

    // Empty content is allowed here: this save only reserves the key
    if (touch && !adapter_->save(file)) {
      BOOST_LOG_TRIVIAL(warning) << "FileStorage: Adapter did not persist touched file with key: " << key;
    }
    return file;
  }

  BOOST_LOG_TRIVIAL(error) << "FileStorage: File already exists with key: " << key;
  throw AlreadyExistsError(key, "File already exists");
}

bool FileStorage::remove(const std::string& key) {
  validate_key(key);

  BOOST_LOG_TRIVIAL(debug) << "FileStorage: Deleting file with key: " << key;
  return adapter_->remove(key);
}


//==============================================
// UTILITY METHODS
//==============================================

bool FileStorage::validate_key(const std::string& key) const {
  // Explicit length keeps the trailing NUL in the set
  static const std::string whitespace(" \t\n\r\v\0", 6);

  if (key.find_first_not_of(whitespace) == std::string::npos) {
    BOOST_LOG_TRIVIAL(error) << "FileStorage: Rejected invalid key: '" << key << "'";
    throw InvalidKeyError(key, "File key cannot be empty");
  }
  return true;
}

} // namespace storage
} // namespace fstore
