#include "storage/local_adapter.hpp"
#include <iomanip>
#include <iterator>
#include <memory>
#include <sstream>
#include <openssl/evp.h>
#include <boost/log/trivial.hpp>

namespace fstore {
namespace storage {

//==============================================
// CONSTRUCTOR
//==============================================

LocalAdapter::LocalAdapter(const std::string& base_path) : base_path_(base_path) {
  BOOST_LOG_TRIVIAL(info) << "LocalAdapter: Initializing with base path: " << base_path;
  try {
    check_directory_exists(base_path_);
  } catch (const std::filesystem::filesystem_error& e) {
    BOOST_LOG_TRIVIAL(error) << "LocalAdapter: Failed to create base directory: " << e.what();
    throw AdapterError("LocalAdapter: Failed to create base directory: " + std::string(e.what()));
  }
  BOOST_LOG_TRIVIAL(debug) << "LocalAdapter: Directory created/verified at: " << base_path;
}


//==============================================
// ADAPTER OPERATIONS
//==============================================

bool LocalAdapter::save(const FileRecord& file) {
  BOOST_LOG_TRIVIAL(info) << "LocalAdapter: Storing file with key: " << file.key();

  std::filesystem::path file_path = resolve_key_path(file.key());
  try {
    check_directory_exists(file_path.parent_path());
  } catch (const std::filesystem::filesystem_error& e) {
    BOOST_LOG_TRIVIAL(error) << "LocalAdapter: Failed to create directory: " << e.what();
    throw AdapterError("LocalAdapter: Failed to create directory: " + std::string(e.what()));
  }
  BOOST_LOG_TRIVIAL(debug) << "LocalAdapter: Calculated file path: " << file_path.string();

  // Binary mode keeps content byte-exact across platforms
  std::ofstream out(file_path, std::ios::binary | std::ios::trunc);
  if (!out) {
    throw AdapterError("LocalAdapter: Failed to create file: " + file_path.string());
  }

  const std::string content = file.content().value_or("");
  out << file.key().size() << '\n';
  out.write(file.key().data(), file.key().size());
  out.write(content.data(), content.size());
  out.close();

  if (!out) {
    BOOST_LOG_TRIVIAL(error) << "LocalAdapter: Write failed for key: " << file.key();
    throw AdapterError("LocalAdapter: Failed to write file: " + file_path.string());
  }

  BOOST_LOG_TRIVIAL(info) << "LocalAdapter: Successfully stored " << content.size()
                          << " bytes with key: " << file.key();
  return true;
}

FileRecord LocalAdapter::load(const std::string& key) {
  BOOST_LOG_TRIVIAL(info) << "LocalAdapter: Retrieving file with key: " << key;

  std::filesystem::path file_path = resolve_key_path(key);
  if (!std::filesystem::exists(file_path)) {
    BOOST_LOG_TRIVIAL(debug) << "LocalAdapter: File not found: " << file_path.string();
    throw NotFoundError(key, "No file stored under key");
  }

  std::ifstream in(file_path, std::ios::binary);
  if (!in) {
    throw AdapterError("LocalAdapter: Failed to open file: " + file_path.string());
  }

  // Header: stored key length, then the key itself
  std::size_t key_length = 0;
  if (!(in >> key_length) || in.get() != '\n') {
    BOOST_LOG_TRIVIAL(error) << "LocalAdapter: Corrupt header in " << file_path.string();
    throw AdapterError("LocalAdapter: Corrupt file header: " + file_path.string());
  }

  // Declared length must fit in the bytes left after the header line
  const std::uintmax_t remaining = std::filesystem::file_size(file_path) -
                                   static_cast<std::uintmax_t>(in.tellg());
  if (key_length > remaining) {
    BOOST_LOG_TRIVIAL(error) << "LocalAdapter: Header key length " << key_length
                             << " exceeds file size in " << file_path.string();
    throw AdapterError("LocalAdapter: Corrupt file header: " + file_path.string());
  }

  std::string stored_key(key_length, '\0');
  if (!in.read(&stored_key[0], static_cast<std::streamsize>(key_length))) {
    throw AdapterError("LocalAdapter: Truncated file header: " + file_path.string());
  }

  if (stored_key != key) {
    // Different key sharing the same digest path
    BOOST_LOG_TRIVIAL(error) << "LocalAdapter: Key mismatch at " << file_path.string();
    throw AdapterError("LocalAdapter: Stored key does not match requested key");
  }

  std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

  BOOST_LOG_TRIVIAL(info) << "LocalAdapter: Successfully read " << content.size()
                          << " bytes for key: " << key;
  return FileRecord(key, std::move(content));
}

FileRecord LocalAdapter::init(const std::string& key, bool touch) {
  BOOST_LOG_TRIVIAL(debug) << "LocalAdapter: Initializing record for key: " << key
                           << (touch ? " (touch requested)" : "");
  return FileRecord(key);
}

bool LocalAdapter::remove(const std::string& key) {
  BOOST_LOG_TRIVIAL(info) << "LocalAdapter: Removing file with key: " << key;

  std::filesystem::path file_path = resolve_key_path(key);
  if (!std::filesystem::exists(file_path)) {
    BOOST_LOG_TRIVIAL(debug) << "LocalAdapter: File not found: " << file_path.string();
    throw NotFoundError(key, "No file stored under key");
  }

  std::error_code ec;
  if (!std::filesystem::remove(file_path, ec)) {
    BOOST_LOG_TRIVIAL(error) << "LocalAdapter: Failed to remove file with key: " << key
                             << " (" << ec.message() << ")";
    throw AdapterError("LocalAdapter: Failed to remove file");
  }

  prune_empty_dirs(file_path.parent_path());

  BOOST_LOG_TRIVIAL(info) << "LocalAdapter: Successfully removed file with key: " << key;
  return true;
}


//==============================================
// QUERY OPERATIONS
//==============================================

bool LocalAdapter::has(const std::string& key) const {
  std::filesystem::path file_path = resolve_key_path(key);
  bool exists = std::filesystem::exists(file_path);

  BOOST_LOG_TRIVIAL(debug) << "LocalAdapter: Key " << key << (exists ? " exists" : " not found")
                           << " at path: " << file_path.string();
  return exists;
}

std::uintmax_t LocalAdapter::file_size(const std::string& key) const {
  std::filesystem::path file_path = resolve_key_path(key);
  if (!std::filesystem::exists(file_path)) {
    throw NotFoundError(key, "No file stored under key");
  }
  return std::filesystem::file_size(file_path);
}

void LocalAdapter::clear() {
  BOOST_LOG_TRIVIAL(info) << "LocalAdapter: Clearing store at: " << base_path_;
  try {
    std::filesystem::remove_all(base_path_);
    check_directory_exists(base_path_);
  } catch (const std::filesystem::filesystem_error& e) {
    BOOST_LOG_TRIVIAL(error) << "LocalAdapter: Failed to clear store: " << e.what();
    throw AdapterError("LocalAdapter: Failed to clear store: " + std::string(e.what()));
  }
}


//==============================================
// CAS STORAGE SUPPORT
//==============================================

std::string LocalAdapter::hash_key(const std::string& key) const {
  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len = 0;

  std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
  if (!ctx) {
    throw AdapterError("LocalAdapter: Failed to create hash context");
  }

  if (!EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr)) {
    throw AdapterError("LocalAdapter: Failed to initialize hash context");
  }
  if (!EVP_DigestUpdate(ctx.get(), key.data(), key.size())) {
    throw AdapterError("LocalAdapter: Failed to update hash");
  }
  if (!EVP_DigestFinal_ex(ctx.get(), hash, &hash_len)) {
    throw AdapterError("LocalAdapter: Failed to finalize hash");
  }

  std::stringstream ss;
  for (unsigned int i = 0; i < hash_len; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
  }
  return ss.str();
}

std::filesystem::path LocalAdapter::get_path_for_hash(const std::string& hash) const {
  std::filesystem::path path = base_path_;

  for (size_t i = 0; i < 6; i += 2) {
    path /= hash.substr(i, 2);
  }

  path /= hash.substr(6);
  return path;
}

std::filesystem::path LocalAdapter::resolve_key_path(const std::string& key) const {
  return get_path_for_hash(hash_key(key));
}


//==============================================
// UTILITY METHODS
//==============================================

void LocalAdapter::check_directory_exists(const std::filesystem::path& path) const {
  if (!std::filesystem::exists(path)) {
    std::filesystem::create_directories(path);
  }
}

void LocalAdapter::prune_empty_dirs(std::filesystem::path path) const {
  // Only the three shard levels below base_path_ are candidates
  std::error_code ec;
  for (int depth = 0; depth < 3; ++depth) {
    if (!std::filesystem::is_empty(path, ec) || ec) {
      break;
    }
    if (!std::filesystem::remove(path, ec)) {
      BOOST_LOG_TRIVIAL(warning) << "LocalAdapter: Could not prune directory " << path.string()
                                 << ": " << ec.message();
      break;
    }
    path = path.parent_path();
  }
}

} // namespace storage
} // namespace fstore
