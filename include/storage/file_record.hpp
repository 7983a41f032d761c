#ifndef FSTORE_STORAGE_FILE_RECORD_HPP
#define FSTORE_STORAGE_FILE_RECORD_HPP

#include <optional>
#include <string>
#include <utility>

namespace fstore {
namespace storage {

// Key + content pair handed between callers, the facade and adapters.
// Content stays absent until the caller (or an adapter load) fills it in.
class FileRecord {
public:
  explicit FileRecord(std::string key) : key_(std::move(key)) {}
  FileRecord(std::string key, std::string content)
    : key_(std::move(key)), content_(std::move(content)) {}

  const std::string& key() const { return key_; }
  const std::optional<std::string>& content() const { return content_; }

  void set_content(std::string content) { content_ = std::move(content); }
  void clear_content() { content_.reset(); }

  // True only when content is present and non-empty
  bool has_content() const { return content_.has_value() && !content_->empty(); }

  bool operator==(const FileRecord& other) const {
    return key_ == other.key_ && content_ == other.content_;
  }
  bool operator!=(const FileRecord& other) const { return !(*this == other); }

private:
  std::string key_;
  std::optional<std::string> content_;
};

} // namespace storage
} // namespace fstore

#endif // FSTORE_STORAGE_FILE_RECORD_HPP
