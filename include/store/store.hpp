#pragma once

#include <cstdint>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>

namespace pous {
namespace store {

class StoreError : public std::runtime_error {
public:
  explicit StoreError(const std::string& message) : std::runtime_error(message) {}
};

// Write-once record files addressed by SHA-256 of the key, laid out as
// {base}/{h[0:2]}/{h[2:4]}/{h[4:6]}/{h[6:]}. Records never change after
// they are published, so readers need no locking.
class Store {
public:
  explicit Store(const std::string& base_path);

  // ---- WRITING ----
  // Publishes data under key and returns the byte count. Throws StoreError
  // if the key is already taken, including by a concurrent writer.
  std::size_t put(const std::string& key, std::istream& data);

  // ---- READING ----
  // Throws StoreError when the key is absent
  std::size_t read(const std::string& key, std::ostream& output) const;
  bool contains(const std::string& key) const;
  // Published records, temporaries excluded
  std::size_t record_count() const;
  const std::filesystem::path& base_path() const { return base_path_; }

private:
  std::filesystem::path base_path_;

  static constexpr const char* TEMP_SUFFIX = ".tmp";

  std::filesystem::path path_for(const std::string& key) const;
  // Sibling of target, unique per writer
  std::filesystem::path staging_path(const std::filesystem::path& target) const;
  static std::size_t copy_stream(std::istream& from, std::ostream& to);
};

} // namespace store
} // namespace pous
