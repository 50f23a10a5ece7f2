#include "store/store.hpp"
#include "crypto/hash.hpp"
#include <boost/log/trivial.hpp>
#include <fstream>
#include <system_error>

namespace pous {
namespace store {

Store::Store(const std::string& base_path) : base_path_(base_path) {
  std::filesystem::create_directories(base_path_);
  BOOST_LOG_TRIVIAL(trace) << "Store: Opened " << base_path_.string();
}


//==============================================
// WRITING
//==============================================

std::size_t Store::put(const std::string& key, std::istream& data) {
  if (!data.good()) {
    BOOST_LOG_TRIVIAL(error) << "Store: Unreadable input for key: " << key;
    throw StoreError("Store: Invalid input stream");
  }

  const std::filesystem::path target = path_for(key);
  if (std::filesystem::exists(target)) {
    BOOST_LOG_TRIVIAL(error) << "Store: Refusing to overwrite key: " << key;
    throw StoreError("Store: Key already exists: " + key);
  }
  std::filesystem::create_directories(target.parent_path());

  const std::filesystem::path staged = staging_path(target);
  std::size_t written = 0;
  {
    std::ofstream file(staged, std::ios::binary);
    if (!file) {
      throw StoreError("Store: Failed to create file: " + staged.string());
    }
    written = copy_stream(data, file);
    file.flush();
    if (!file) {
      file.close();
      std::error_code ignored;
      std::filesystem::remove(staged, ignored);
      throw StoreError("Store: Failed to write file: " + staged.string());
    }
  }

  // Linking fails when the target exists, so only one writer can publish
  std::error_code link_error;
  std::filesystem::create_hard_link(staged, target, link_error);
  std::error_code ignored;
  std::filesystem::remove(staged, ignored);
  if (link_error) {
    if (link_error == std::errc::file_exists) {
      BOOST_LOG_TRIVIAL(error) << "Store: Lost publish race for key: " << key;
      throw StoreError("Store: Key already exists: " + key);
    }
    throw StoreError("Store: Failed to publish record: " + link_error.message());
  }

  BOOST_LOG_TRIVIAL(trace) << "Store: Published " << written << " bytes under " << key;
  return written;
}


//==============================================
// READING
//==============================================

std::size_t Store::read(const std::string& key, std::ostream& output) const {
  const std::filesystem::path source = path_for(key);
  std::ifstream file(source, std::ios::binary);
  if (!file) {
    BOOST_LOG_TRIVIAL(debug) << "Store: No record for key: " << key;
    throw StoreError("Store: Key not found: " + key);
  }

  std::size_t copied = copy_stream(file, output);
  if (!output.good()) {
    throw StoreError("Store: Failed to write to output stream");
  }
  return copied;
}

bool Store::contains(const std::string& key) const {
  return std::filesystem::exists(path_for(key));
}

std::size_t Store::record_count() const {
  std::size_t records = 0;
  for (const auto& entry : std::filesystem::recursive_directory_iterator(base_path_)) {
    if (entry.is_regular_file() && entry.path().extension() != TEMP_SUFFIX) {
      ++records;
    }
  }
  return records;
}


//==============================================
// PATHS
//==============================================

std::filesystem::path Store::path_for(const std::string& key) const {
  const std::string digest = crypto::to_hex(crypto::sha256(key.data(), key.size()));
  return base_path_ / digest.substr(0, 2) / digest.substr(2, 2) / digest.substr(4, 2) / digest.substr(6);
}

std::filesystem::path Store::staging_path(const std::filesystem::path& target) const {
  std::filesystem::path staged = target;
  staged += "." + crypto::to_hex(crypto::random_bytes(8)) + TEMP_SUFFIX;
  return staged;
}

std::size_t Store::copy_stream(std::istream& from, std::ostream& to) {
  char buffer[4096];
  std::size_t total = 0;
  while (from.read(buffer, sizeof(buffer)) || from.gcount() > 0) {
    to.write(buffer, from.gcount());
    total += static_cast<std::size_t>(from.gcount());
  }
  return total;
}

} // namespace store
} // namespace pous
