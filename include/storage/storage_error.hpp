#ifndef FSTORE_STORAGE_ERROR_HPP
#define FSTORE_STORAGE_ERROR_HPP

#include <stdexcept>
#include <string>

namespace fstore {
namespace storage {

enum class StorageErrc {
  INVALID_KEY,
  EMPTY_CONTENT,
  NOT_FOUND,
  ALREADY_EXISTS
};

inline const char* storage_errc_to_string(StorageErrc code) {
  switch (code) {
    case StorageErrc::INVALID_KEY: return "Invalid key";
    case StorageErrc::EMPTY_CONTENT: return "Empty content";
    case StorageErrc::NOT_FOUND: return "Not found";
    case StorageErrc::ALREADY_EXISTS: return "Already exists";
    default: return "Undefined error";
  }
}

class StorageError : public std::runtime_error {
public:
  StorageError(StorageErrc code, const std::string& key, const std::string& message)
    : std::runtime_error(std::string(storage_errc_to_string(code)) + ": " + message)
    , code_(code)
    , key_(key) {}

  StorageErrc code() const { return code_; }
  const std::string& key() const { return key_; }

private:
  StorageErrc code_;
  std::string key_;
};

class InvalidKeyError : public StorageError {
public:
  InvalidKeyError(const std::string& key, const std::string& message)
    : StorageError(StorageErrc::INVALID_KEY, key, message) {}
};

class EmptyContentError : public StorageError {
public:
  EmptyContentError(const std::string& key, const std::string& message)
    : StorageError(StorageErrc::EMPTY_CONTENT, key, message) {}
};

class NotFoundError : public StorageError {
public:
  NotFoundError(const std::string& key, const std::string& message)
    : StorageError(StorageErrc::NOT_FOUND, key, message) {}
};

class AlreadyExistsError : public StorageError {
public:
  AlreadyExistsError(const std::string& key, const std::string& message)
    : StorageError(StorageErrc::ALREADY_EXISTS, key, message) {}
};

} // namespace storage
} // namespace fstore

#endif // FSTORE_STORAGE_ERROR_HPP
